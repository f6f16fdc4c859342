#include "PageExtractor.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <regex>
#include <stdexcept>
#include <utility>
#include "../core/Errors.hpp"
#include "../utils/UrlUtil.hpp"

namespace {

using Anime1Relay::MalformedPage;

const std::string kAllEpisodesLabel = "\xE5\x85\xA8\xE9\x9B\x86\xE9\x80\xA3\xE7\xB5\x90"; // 全集連結
const std::string kNextEpisodeLabel = "\xE4\xB8\x8B\xE4\xB8\x80\xE9\x9B\x86";             // 下一集

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

// Owns a parsed lexbor document and the collections handed out while walking it.
class HtmlDocument {
public:
    explicit HtmlDocument(const std::string& html) {
        document_ = lxb_html_document_create();
        if (!document_) {
            throw std::runtime_error("Failed to create lexbor document");
        }
        lxb_status_t status = lxb_html_document_parse(document_,
            reinterpret_cast<const lxb_char_t*>(html.c_str()), html.length());
        if (status != LXB_STATUS_OK) {
            lxb_html_document_destroy(document_);
            document_ = nullptr;
            throw MalformedPage("HTML document could not be parsed");
        }
    }

    ~HtmlDocument() {
        if (document_) lxb_html_document_destroy(document_);
    }

    HtmlDocument(const HtmlDocument&) = delete;
    HtmlDocument& operator=(const HtmlDocument&) = delete;

    lxb_dom_element_t* Root() {
        return lxb_dom_document_element(lxb_html_document_original_ref(document_));
    }

    lxb_dom_element_t* Body() {
        auto* body = lxb_html_document_body_element(document_);
        return body ? lxb_dom_interface_element(body) : nullptr;
    }

    // Descendants of root with the given tag, in document order.
    std::vector<lxb_dom_element_t*> FindAll(lxb_dom_element_t* root, const char* tag) {
        std::vector<lxb_dom_element_t*> out;
        if (!root) return out;
        lxb_dom_collection_t* col = lxb_dom_collection_make(lxb_html_document_original_ref(document_), 16);
        if (!col) {
            throw std::runtime_error("Failed to allocate lexbor collection");
        }
        lxb_status_t status = lxb_dom_elements_by_tag_name(root, col,
            reinterpret_cast<const lxb_char_t*>(tag), strlen(tag));
        if (status == LXB_STATUS_OK) {
            const size_t count = lxb_dom_collection_length(col);
            out.reserve(count);
            for (size_t i = 0; i < count; ++i) {
                out.push_back(lxb_dom_collection_element(col, i));
            }
        }
        lxb_dom_collection_destroy(col, true);
        return out;
    }

    lxb_dom_element_t* FindFirst(lxb_dom_element_t* root, const char* tag) {
        auto all = FindAll(root, tag);
        return all.empty() ? nullptr : all.front();
    }

    lxb_dom_element_t* FindFirstWithClass(lxb_dom_element_t* root, const char* tag, const std::string& cls) {
        for (auto* el : FindAll(root, tag)) {
            if (HasClass(el, cls)) return el;
        }
        return nullptr;
    }

    lxb_dom_element_t* FindFirstWithAttribute(lxb_dom_element_t* root, const char* tag, const char* attr) {
        for (auto* el : FindAll(root, tag)) {
            if (lxb_dom_element_has_attribute(el, reinterpret_cast<const lxb_char_t*>(attr), strlen(attr))) return el;
        }
        return nullptr;
    }

    lxb_dom_element_t* FindLinkByText(lxb_dom_element_t* root, const std::string& text) {
        for (auto* el : FindAll(root, "a")) {
            if (Text(el) == text) return el;
        }
        return nullptr;
    }

    static std::optional<std::string> Attribute(lxb_dom_element_t* element, const char* key) {
        if (!element) return std::nullopt;
        const auto* name = reinterpret_cast<const lxb_char_t*>(key);
        if (!lxb_dom_element_has_attribute(element, name, strlen(key))) return std::nullopt;
        size_t len = 0;
        const lxb_char_t* value = lxb_dom_element_get_attribute(element, name, strlen(key), &len);
        return to_std_string(value, len);
    }

    static std::string Text(lxb_dom_element_t* element) {
        if (!element) return "";
        lxb_dom_node_t* node = lxb_dom_interface_node(element);
        size_t len = 0;
        lxb_char_t* text = lxb_dom_node_text_content(node, &len);
        std::string out = to_std_string(text, len);
        if (text) lxb_dom_document_destroy_text(node->owner_document, text);
        return out;
    }

    static bool HasClass(lxb_dom_element_t* element, const std::string& cls) {
        auto classes = Attribute(element, "class");
        if (!classes) return false;
        const std::string& s = *classes;
        size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            size_t start = i;
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            if (i > start && s.compare(start, i - start, cls) == 0) return true;
        }
        return false;
    }

private:
    lxb_html_document_t* document_ = nullptr;
};

template <typename T>
T Require(std::optional<T> value, const std::string& what) {
    if (!value) throw MalformedPage("Missing " + what);
    return std::move(*value);
}

lxb_dom_element_t* Require(lxb_dom_element_t* element, const std::string& what) {
    if (!element) throw MalformedPage("Missing " + what);
    return element;
}

// "/?cat=123" -> "123"
std::string QueryValueOf(const std::string& href, const std::string& what) {
    return Require(Anime1Relay::UrlUtil::SplitPart(href, '=', 1), what + " id");
}

std::vector<Anime1Relay::Post> ParseArticles(HtmlDocument& doc) {
    std::vector<Anime1Relay::Post> posts;
    for (auto* article : doc.FindAll(doc.Root(), "article")) {
        auto article_id = HtmlDocument::Attribute(article, "id");
        if (!article_id) continue;

        auto* header = Require(doc.FindFirst(article, "header"), "post header");
        auto* content = Require(doc.FindFirstWithClass(article, "div", "entry-content"), "post content");
        auto* content_p = Require(doc.FindFirst(content, "p"), "post links paragraph");
        auto* video = Require(doc.FindFirstWithAttribute(content, "video", "id"), "video element");
        auto* all_posts_link = Require(doc.FindLinkByText(content_p, kAllEpisodesLabel), "category link");
        auto* next_post_link = doc.FindLinkByText(content_p, kNextEpisodeLabel);

        Anime1Relay::Post post;
        post.id = Require(Anime1Relay::UrlUtil::SplitPart(*article_id, '-', 1), "post id");
        post.title = HtmlDocument::Text(Require(doc.FindFirst(header, "h2"), "post title"));
        post.order = Anime1Relay::PageExtractor::ParseOrder(post.title);
        post.timestamp = Require(HtmlDocument::Attribute(doc.FindFirst(header, "time"), "datetime"), "post time");
        post.category_id = QueryValueOf(Require(HtmlDocument::Attribute(all_posts_link, "href"), "category link href"), "category");
        post.video_id = Require(HtmlDocument::Attribute(video, "data-vid"), "data-vid");
        post.thumbnails_server = Require(HtmlDocument::Attribute(video, "data-tserver"), "data-tserver");
        post.resolution_token = Anime1Relay::UrlUtil::PercentDecode(
            Require(HtmlDocument::Attribute(video, "data-apireq"), "data-apireq"));
        if (next_post_link) {
            post.next_post_id = QueryValueOf(Require(HtmlDocument::Attribute(next_post_link, "href"), "next link href"), "next post");
        }
        posts.push_back(std::move(post));
    }
    Anime1Relay::PageExtractor::ApplyCanonicalOrder(posts);
    return posts;
}

} // anonymous namespace

namespace Anime1Relay {

PageKind PageExtractor::Classify(const std::string& html) {
    HtmlDocument doc(html);
    auto* body = doc.Body();
    if (!body) return PageKind::Unknown;
    if (HtmlDocument::HasClass(body, "category")) return PageKind::Category;
    if (HtmlDocument::HasClass(body, "single-post")) return PageKind::SinglePost;
    return PageKind::Unknown;
}

std::vector<Post> PageExtractor::ExtractPosts(const std::string& html) {
    HtmlDocument doc(html);
    return ParseArticles(doc);
}

Category PageExtractor::ExtractCategory(const std::string& html) {
    static const std::regex category_id_pattern(R"('categoryID':\s'(.*?)')");

    HtmlDocument doc(html);
    auto* first_script = Require(doc.FindFirst(doc.Root(), "script"), "inline script");
    std::string script_text = HtmlDocument::Text(first_script);
    std::smatch match;
    if (!std::regex_search(script_text, match, category_id_pattern)) {
        throw MalformedPage("Missing category id in inline script");
    }

    auto* page_header = Require(doc.FindFirstWithClass(doc.Root(), "header", "page-header"), "page header");
    auto* page_title = Require(doc.FindFirstWithClass(page_header, "h1", "page-title"), "page title");

    Category category;
    category.id = match[1].str();
    category.title = HtmlDocument::Text(page_title);
    category.posts = ParseArticles(doc);
    return category;
}

std::optional<int> PageExtractor::ParseOrder(const std::string& title) {
    static const std::regex order_pattern(R"(\[(\d+)\])");
    std::smatch match;
    if (!std::regex_search(title, match, order_pattern)) return std::nullopt;
    try {
        return std::stoi(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

void PageExtractor::ApplyCanonicalOrder(std::vector<Post>& posts) {
    bool all_have_order = std::all_of(posts.begin(), posts.end(), [](const Post& p) { return p.order.has_value(); });
    if (all_have_order) {
        std::stable_sort(posts.begin(), posts.end(), [](const Post& a, const Post& b) { return *a.order < *b.order; });
    } else {
        std::reverse(posts.begin(), posts.end());
    }
}

}
