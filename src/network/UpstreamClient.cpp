#include "UpstreamClient.hpp"
#include <nlohmann/json.hpp>
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace Anime1Relay {

UpstreamClient::UpstreamClient(const Config& config, IHttpTransport& transport, IPageExtractor& extractor)
    : config_(config), transport_(transport), extractor_(extractor) {}

bool UpstreamClient::IsValidPostsUrl(const std::string& url) {
    return UrlUtil::HostMatchesDomain(UrlUtil::ExtractHost(url), kMainHost);
}

HeaderList UpstreamClient::PageHeaders() const {
    return {
        {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,image/apng,*/*;q=0.8,application/signed-exchange;v=b3;q=0.7"},
        {"Accept-Encoding", "gzip, deflate"},
        {"Accept-Language", config_.accept_language},
        {"Cache-Control", "max-age=0"},
        {"Referer", std::string(kMainUrl) + "/"},
        {"User-Agent", config_.user_agent},
    };
}

HeaderList UpstreamClient::ApiHeaders() const {
    return {
        {"Accept", "*/*"},
        {"Accept-Encoding", "gzip, deflate"},
        {"Accept-Language", config_.accept_language},
        {"Cache-Control", "max-age=0"},
        {"Pragma", "no-cache"},
        {"Content-Type", "application/x-www-form-urlencoded"},
        {"Origin", kMainUrl},
        {"Referer", std::string(kMainUrl) + "/"},
        {"User-Agent", config_.user_agent},
    };
}

HeaderList UpstreamClient::VideoHeaders(const std::optional<std::string>& range,
                                        const std::optional<std::string>& if_range) const {
    HeaderList headers = {
        {"Accept", "*/*"},
        {"Accept-Encoding", "identity;q=1, *;q=0"},
        {"Accept-Language", config_.accept_language},
        {"Referer", std::string(kMainUrl) + "/"},
        {"User-Agent", config_.user_agent},
    };
    if (range) headers.emplace_back("Range", *range);
    if (if_range) headers.emplace_back("If-Range", *if_range);
    return headers;
}

std::string UpstreamClient::FetchPage(const std::string& url) {
    HttpRequest request;
    request.url = url;
    request.headers = PageHeaders();
    request.decode_content = true;
    return transport_.Perform(request).body;
}

PageContent UpstreamClient::FetchPostsOrCategory(const std::string& url) {
    if (!IsValidPostsUrl(url)) {
        throw InvalidUrl();
    }
    std::string html = FetchPage(url);
    switch (extractor_.Classify(html)) {
        case PageKind::Category:
            return extractor_.ExtractCategory(html);
        case PageKind::SinglePost: {
            auto posts = extractor_.ExtractPosts(html);
            if (posts.empty()) return std::monostate{};
            return std::move(posts.front());
        }
        case PageKind::Unknown:
            break;
    }
    Logger::Log(LogLevel::Debug, "Page is neither a category nor a post: " + url);
    return std::monostate{};
}

std::optional<Category> UpstreamClient::FetchCategory(const std::string& category_id) {
    std::string html = FetchPage(std::string(kMainUrl) + "/?" + UrlUtil::FormEncode({{"cat", category_id}}));
    if (extractor_.Classify(html) != PageKind::Category) return std::nullopt;
    return extractor_.ExtractCategory(html);
}

std::optional<Post> UpstreamClient::FetchPost(const std::string& post_id) {
    std::string html = FetchPage(std::string(kMainUrl) + "/" + UrlUtil::PercentEncode(post_id));
    if (extractor_.Classify(html) != PageKind::SinglePost) return std::nullopt;
    auto posts = extractor_.ExtractPosts(html);
    if (posts.empty()) return std::nullopt;
    return std::move(posts.front());
}

ResolvedVideo UpstreamClient::ResolveVideo(const std::string& resolution_token) {
    HttpRequest request;
    request.url = kApiUrl;
    request.headers = ApiHeaders();
    request.form_body = UrlUtil::FormEncode({{"d", resolution_token}});
    request.decode_content = true;
    HttpResponse response = transport_.Perform(request);

    ResolvedVideo video;
    try {
        nlohmann::json data = nlohmann::json::parse(response.body);
        const nlohmann::json& sources = data.is_array() ? data : data.at("s");
        const nlohmann::json& first = sources.at(0);
        video.backing_url = UrlUtil::ResolveAgainst(kApiUrl, first.at("src").get<std::string>());
        video.media_type = first.at("type").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw MalformedPage("Unexpected resolution response: " + std::string(e.what()));
    }

    auto expiry = response.cookies.find("e");
    if (expiry == response.cookies.end()) {
        throw MalformedPage("Resolution response carries no expiry cookie");
    }
    try {
        video.expires_at = std::stoll(expiry->second) - kExpireOffsetSeconds;
    } catch (const std::logic_error&) {
        throw MalformedPage("Invalid expiry cookie value: " + expiry->second);
    }
    video.session_cookies = std::move(response.cookies);

    Logger::Log(LogLevel::Debug, "Resolved backing url " + video.backing_url + " (expires " + std::to_string(video.expires_at) + ")");
    return video;
}

void UpstreamClient::Preheat() {
    transport_.Preheat();
}

void UpstreamClient::ResetConnection() {
    transport_.Reset();
}

}
