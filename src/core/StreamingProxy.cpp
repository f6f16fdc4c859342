#include "StreamingProxy.hpp"
#include <utility>
#include "../network/UpstreamClient.hpp"
#include "../utils/Logger.hpp"

namespace Anime1Relay {

namespace {

// lower-case lookup name, name sent to the client
const std::pair<const char*, const char*> kRelayedHeaders[] = {
    {"content-length", "Content-Length"},
    {"content-range", "Content-Range"},
    {"etag", "ETag"},
    {"last-modified", "Last-Modified"},
};

}

StreamingProxy::StreamingProxy(IHttpTransport& transport, const UpstreamClient& upstream)
    : transport_(transport), upstream_(upstream) {}

HeaderList StreamingProxy::FilterHeaders(const HeaderMap& upstream_headers) {
    HeaderList relayed;
    for (const auto& header : kRelayedHeaders) {
        auto it = upstream_headers.find(header.first);
        if (it != upstream_headers.end()) {
            relayed.emplace_back(header.second, it->second);
        }
    }
    return relayed;
}

VideoStream StreamingProxy::OpenStream(const ResolvedVideo& video,
                                       const std::optional<std::string>& range,
                                       const std::optional<std::string>& if_range) {
    HttpRequest request;
    request.url = video.backing_url;
    request.headers = upstream_.VideoHeaders(range, if_range);
    // The jar holds whatever the latest resolution set; a cached video needs its own cookies.
    request.use_cookie_jar = false;
    // Session cookies only go back to the upstream's own domain.
    if (UpstreamClient::IsValidPostsUrl(video.backing_url)) {
        request.cookies = video.session_cookies;
    }

    Logger::Log(LogLevel::Debug, "Proxying " + video.backing_url + (range ? " range " + *range : std::string()));
    auto body = transport_.OpenStream(request);

    VideoStream stream;
    stream.status = body->StatusCode();
    stream.headers = FilterHeaders(body->Headers());
    auto content_type = body->Headers().find("content-type");
    stream.media_type = content_type != body->Headers().end() ? content_type->second : video.media_type;
    stream.body = std::move(body);
    return stream;
}

}
