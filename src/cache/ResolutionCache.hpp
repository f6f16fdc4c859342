#pragma once
#include <cstdint>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "../interfaces/IResolutionCache.hpp"
#include "../interfaces/IUpstreamClient.hpp"

namespace Anime1Relay {
    // Post id -> ResolvedVideo, valid until the video's own expiry.
    // Concurrent misses for one post id share a single upstream resolution.
    class ResolutionCache : public IResolutionCache {
    public:
        using Clock = std::function<std::int64_t()>; // epoch seconds

        ResolutionCache(IUpstreamClient& upstream, size_t max_size, Clock clock = SystemClock);

        ResolvedVideo GetOrResolve(const std::string& post_id) override;
        void Clear() override;

        std::optional<ResolvedVideo> Peek(const std::string& post_id);
        size_t Size();

        static std::int64_t SystemClock();

    private:
        struct CacheEntry {
            std::string post_id;
            ResolvedVideo video;
        };

        std::optional<ResolvedVideo> LookupUnlocked(const std::string& post_id, std::int64_t now);
        void InsertUnlocked(const std::string& post_id, const ResolvedVideo& video, std::int64_t now);
        ResolvedVideo Resolve(const std::string& post_id);

        IUpstreamClient& upstream_;
        size_t max_size_;
        Clock clock_;
        std::list<CacheEntry> cache_list_; // front = most recently used
        std::unordered_map<std::string, decltype(cache_list_.begin())> cache_map_;
        std::unordered_map<std::string, std::shared_future<ResolvedVideo>> in_flight_;
        std::mutex cache_mutex_;
    };
}
