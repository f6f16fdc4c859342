#include "RelayService.hpp"
#include <stdexcept>
#include "Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"

namespace Anime1Relay {

RelayService::RelayService(IUpstreamClient& upstream, IResolutionCache& cache, StreamingProxy& proxy)
    : upstream_(upstream), cache_(cache), proxy_(proxy) {}

void RelayService::EnsureRunning() const {
    if (!running_) {
        throw std::runtime_error("Relay service has been shut down");
    }
}

nlohmann::ordered_json RelayService::Resolve(const std::string& base_uri, const std::string& url) {
    EnsureRunning();
    PageContent content = upstream_.FetchPostsOrCategory(url);
    const std::string base = UrlUtil::TrimTrailingSlashes(base_uri);

    nlohmann::ordered_json result;
    if (const auto* post = std::get_if<Post>(&content)) {
        result["type"] = "single";
        result["id"] = post->id;
        result["title"] = post->title;
        result["category"] = post->category_id;
        result["url"] = base + "/v/" + post->id;
        return result;
    }
    if (const auto* category = std::get_if<Category>(&content)) {
        const std::string category_url = base + "/c/" + category->id;
        result["type"] = "category";
        result["id"] = category->id;
        result["title"] = category->title;
        result["url"] = category_url;

        nlohmann::ordered_json playlists = nlohmann::ordered_json::object();
        for (PlaylistType type : PlaylistBuilder::kAllTypes) {
            const std::string name = PlaylistBuilder::TypeName(type);
            playlists[name] = category_url + "?playlist=" + name;
        }
        result["playlists"] = std::move(playlists);

        nlohmann::ordered_json videos = nlohmann::ordered_json::array();
        for (const auto& p : category->posts) {
            videos.push_back({{"id", p.id}, {"title", p.title}, {"url", base + "/v/" + p.id}});
        }
        result["videos"] = std::move(videos);
        return result;
    }
    throw UnknownUrlType();
}

PlaylistInfo RelayService::GetPlaylist(const std::string& base_uri, const std::string& category_id,
                                       const std::optional<std::string>& format) {
    EnsureRunning();
    PlaylistType type = format ? PlaylistBuilder::ParseType(*format) : PlaylistType::M3U8;
    auto category = upstream_.FetchCategory(category_id);
    if (!category) {
        throw UnknownCategory();
    }
    return PlaylistBuilder::Build(type, base_uri, *category);
}

VideoStream RelayService::OpenVideo(const std::string& post_id,
                                    const std::optional<std::string>& range,
                                    const std::optional<std::string>& if_range) {
    EnsureRunning();
    ResolvedVideo video = cache_.GetOrResolve(post_id);
    return proxy_.OpenStream(video, range, if_range);
}

void RelayService::Preheat() {
    EnsureRunning();
    upstream_.Preheat();
    Logger::Log(LogLevel::Info, "Upstream connection context ready.");
}

void RelayService::Reset() {
    EnsureRunning();
    upstream_.ResetConnection();
}

void RelayService::Shutdown() {
    if (!running_.exchange(false)) return;
    cache_.Clear();
    upstream_.ResetConnection();
    Logger::Log(LogLevel::Info, "Relay service shut down.");
}

}
