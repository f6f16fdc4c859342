#include <catch2/catch_all.hpp>
#include <string>
#include <vector>
#include "core/Errors.hpp"
#include "parser/PageExtractor.hpp"

using namespace Anime1Relay;

namespace {

std::string Article(const std::string& id, const std::string& title, bool with_next = true) {
    std::string html =
        "<article id=\"post-" + id + "\" class=\"post-" + id + " post type-post\">"
        "<header class=\"entry-header\"><h2 class=\"entry-title\"><a href=\"https://anime1.me/" + id + "\">" + title + "</a></h2>"
        "<div class=\"entry-meta\"><time class=\"entry-date\" datetime=\"2023-04-0" + id.substr(id.size() - 1) + "T12:00:00+08:00\">x</time></div></header>"
        "<div class=\"entry-content\"><p><a href=\"https://anime1.me/?cat=777\">全集連結</a>";
    if (with_next) {
        html += " <a href=\"https://anime1.me/?p=" + id + "9\">下一集</a>";
    }
    html += "</p><div class=\"vjscontainer\"><video id=\"vjs-" + id + "\" class=\"video-js\" data-vid=\"v" + id +
            "\" data-tserver=\"pic\" data-apireq=\"%7B%22c%22%3A%22777%22%2C%22e%22%3A%22" + id + "%22%7D\"></video></div></div>"
            "</article>";
    return html;
}

std::string SinglePage(const std::string& article) {
    return "<!DOCTYPE html><html><head><title>t</title></head>"
           "<body class=\"post-template-default single single-post postid-1\">" + article + "</body></html>";
}

std::string CategoryPage(const std::vector<std::string>& articles,
                         const std::string& script = "<script>var anime1_vars = {'categoryID': '777'};</script>") {
    std::string html = "<!DOCTYPE html><html><head>" + script + "</head>"
                       "<body class=\"archive category category-777\">"
                       "<header class=\"page-header\"><h1 class=\"page-title\">Some Show</h1></header>";
    for (const auto& a : articles) html += a;
    return html + "</body></html>";
}

}

TEST_CASE("Classify reads the body class") {
    PageExtractor extractor;
    CHECK(extractor.Classify(SinglePage(Article("101", "Show [01]"))) == PageKind::SinglePost);
    CHECK(extractor.Classify(CategoryPage({})) == PageKind::Category);
    CHECK(extractor.Classify("<html><body class=\"home blog\"></body></html>") == PageKind::Unknown);
    CHECK(extractor.Classify("<html><body></body></html>") == PageKind::Unknown);
}

TEST_CASE("ExtractPosts fills every post field") {
    PageExtractor extractor;
    auto posts = extractor.ExtractPosts(SinglePage(Article("101", "Show [01]")));
    REQUIRE(posts.size() == 1);
    const Post& post = posts[0];
    CHECK(post.id == "101");
    CHECK(post.title == "Show [01]");
    REQUIRE(post.order.has_value());
    CHECK(*post.order == 1);
    CHECK(post.timestamp == "2023-04-01T12:00:00+08:00");
    CHECK(post.category_id == "777");
    CHECK(post.video_id == "v101");
    CHECK(post.thumbnails_server == "pic");
    CHECK(post.resolution_token == "{\"c\":\"777\",\"e\":\"101\"}");
    REQUIRE(post.next_post_id.has_value());
    CHECK(*post.next_post_id == "1019");
}

TEST_CASE("Next post is optional") {
    PageExtractor extractor;
    auto posts = extractor.ExtractPosts(SinglePage(Article("102", "Show [02]", false)));
    REQUIRE(posts.size() == 1);
    CHECK_FALSE(posts[0].next_post_id.has_value());
}

TEST_CASE("Posts are ordered by their [N] marker when all have one") {
    PageExtractor extractor;
    auto category = extractor.ExtractCategory(CategoryPage({
        Article("103", "Show [3]"), Article("101", "Show [1]"), Article("102", "Show [2]")
    }));
    REQUIRE(category.posts.size() == 3);
    CHECK(category.posts[0].id == "101");
    CHECK(category.posts[1].id == "102");
    CHECK(category.posts[2].id == "103");
}

TEST_CASE("Posts without markers are returned oldest first") {
    PageExtractor extractor;
    // Listing pages show the newest post first.
    auto category = extractor.ExtractCategory(CategoryPage({
        Article("103", "Show C"), Article("102", "Show B [2]"), Article("101", "Show A")
    }));
    REQUIRE(category.posts.size() == 3);
    CHECK(category.posts[0].title == "Show A");
    CHECK(category.posts[1].title == "Show B [2]");
    CHECK(category.posts[2].title == "Show C");
}

TEST_CASE("ExtractCategory reads the id from the inline script and the page title") {
    PageExtractor extractor;
    auto category = extractor.ExtractCategory(CategoryPage({ Article("101", "Show [1]") }));
    CHECK(category.id == "777");
    CHECK(category.title == "Some Show");
    CHECK(category.posts.size() == 1);
}

TEST_CASE("An empty category is valid") {
    PageExtractor extractor;
    auto category = extractor.ExtractCategory(CategoryPage({}));
    CHECK(category.id == "777");
    CHECK(category.posts.empty());
}

TEST_CASE("Missing elements fail the page") {
    PageExtractor extractor;

    SECTION("no video element") {
        std::string article = Article("101", "Show [1]");
        auto pos = article.find("<video");
        article.replace(pos, article.find("</video>") + 8 - pos, "");
        CHECK_THROWS_AS(extractor.ExtractPosts(SinglePage(article)), MalformedPage);
    }
    SECTION("no category link") {
        std::string article = Article("101", "Show [1]", false);
        auto pos = article.find("全集連結");
        article.replace(pos, std::string("全集連結").size(), "All");
        CHECK_THROWS_AS(extractor.ExtractPosts(SinglePage(article)), MalformedPage);
    }
    SECTION("no category id in the script") {
        CHECK_THROWS_AS(extractor.ExtractCategory(CategoryPage({}, "<script>var x = 1;</script>")), MalformedPage);
    }
    SECTION("no script at all") {
        CHECK_THROWS_AS(extractor.ExtractCategory(CategoryPage({}, "")), MalformedPage);
    }
}

TEST_CASE("ParseOrder takes the first bracketed number") {
    CHECK(PageExtractor::ParseOrder("Show [12]") == std::optional<int>(12));
    CHECK(PageExtractor::ParseOrder("Show [05] [END]") == std::optional<int>(5));
    CHECK_FALSE(PageExtractor::ParseOrder("Show OVA").has_value());
}
