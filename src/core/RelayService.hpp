#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "PlaylistBuilder.hpp"
#include "StreamingProxy.hpp"
#include "../interfaces/IResolutionCache.hpp"
#include "../interfaces/IUpstreamClient.hpp"

namespace Anime1Relay {

    // Entry points used by the HTTP router. Owns no components; they are
    // constructed by the caller and must outlive the service.
    class RelayService {
    public:
        RelayService(IUpstreamClient& upstream, IResolutionCache& cache, StreamingProxy& proxy);

        // Describes a post or category page as JSON with relay URLs under base_uri.
        nlohmann::ordered_json Resolve(const std::string& base_uri, const std::string& url);

        // format defaults to m3u8.
        PlaylistInfo GetPlaylist(const std::string& base_uri, const std::string& category_id,
                                 const std::optional<std::string>& format);

        VideoStream OpenVideo(const std::string& post_id,
                              const std::optional<std::string>& range,
                              const std::optional<std::string>& if_range);

        void Preheat();
        void Reset();
        void Shutdown();
        bool IsRunning() const noexcept { return running_; }

    private:
        void EnsureRunning() const;

        IUpstreamClient& upstream_;
        IResolutionCache& cache_;
        StreamingProxy& proxy_;
        std::atomic<bool> running_{true};
    };

}
