#include "ResolutionCache.hpp"
#include <chrono>
#include "../core/Errors.hpp"
#include "../utils/Logger.hpp"

namespace Anime1Relay {

ResolutionCache::ResolutionCache(IUpstreamClient& upstream, size_t max_size, Clock clock)
    : upstream_(upstream), max_size_(max_size == 0 ? 1 : max_size), clock_(std::move(clock)) {}

std::int64_t ResolutionCache::SystemClock() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<ResolvedVideo> ResolutionCache::LookupUnlocked(const std::string& post_id, std::int64_t now) {
    auto it = cache_map_.find(post_id);
    if (it == cache_map_.end()) {
        return std::nullopt;
    }

    if (now >= it->second->video.expires_at) {
        Logger::Log(LogLevel::Debug, "Cached video expired for post " + post_id);
        cache_list_.erase(it->second);
        cache_map_.erase(it);
        return std::nullopt;
    }

    // Move the accessed element to the front of the list (most recently used)
    cache_list_.splice(cache_list_.begin(), cache_list_, it->second);
    return it->second->video;
}

void ResolutionCache::InsertUnlocked(const std::string& post_id, const ResolvedVideo& video, std::int64_t now) {
    auto it = cache_map_.find(post_id);
    if (it != cache_map_.end()) {
        cache_list_.erase(it->second);
        cache_map_.erase(it);
    }

    cache_list_.push_front({post_id, video});
    cache_map_[post_id] = cache_list_.begin();

    if (cache_map_.size() <= max_size_) return;

    // Over the limit: drop everything already expired, then the least recently used.
    for (auto entry = cache_list_.begin(); entry != cache_list_.end();) {
        if (now >= entry->video.expires_at) {
            cache_map_.erase(entry->post_id);
            entry = cache_list_.erase(entry);
        } else {
            ++entry;
        }
    }
    while (cache_map_.size() > max_size_ && !cache_list_.empty()) {
        const auto& lru_entry = cache_list_.back();
        Logger::Log(LogLevel::Debug, "Evicting cached video for post " + lru_entry.post_id);
        cache_map_.erase(lru_entry.post_id);
        cache_list_.pop_back();
    }
}

ResolvedVideo ResolutionCache::Resolve(const std::string& post_id) {
    auto post = upstream_.FetchPost(post_id);
    if (!post) {
        throw UnknownVideo();
    }
    return upstream_.ResolveVideo(post->resolution_token);
}

ResolvedVideo ResolutionCache::GetOrResolve(const std::string& post_id) {
    std::promise<ResolvedVideo> promise;
    std::shared_future<ResolvedVideo> pending;
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        if (auto cached = LookupUnlocked(post_id, clock_())) {
            Logger::Log(LogLevel::Debug, "Cache hit for post " + post_id);
            return *cached;
        }
        auto flight = in_flight_.find(post_id);
        if (flight != in_flight_.end()) {
            pending = flight->second;
        } else {
            in_flight_[post_id] = promise.get_future().share();
        }
    }

    if (pending.valid()) {
        Logger::Log(LogLevel::Debug, "Waiting for in-flight resolution of post " + post_id);
        return pending.get();
    }

    Logger::Log(LogLevel::Debug, "Cache miss. Resolving post " + post_id);
    try {
        ResolvedVideo video = Resolve(post_id);
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            InsertUnlocked(post_id, video, clock_());
            in_flight_.erase(post_id);
        }
        promise.set_value(video);
        return video;
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "Resolution failed for post " + post_id + ": " + e.what());
        {
            std::lock_guard<std::mutex> lock(cache_mutex_);
            in_flight_.erase(post_id);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<ResolvedVideo> ResolutionCache::Peek(const std::string& post_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    auto it = cache_map_.find(post_id);
    if (it == cache_map_.end()) return std::nullopt;
    return it->second->video;
}

size_t ResolutionCache::Size() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_map_.size();
}

void ResolutionCache::Clear() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_list_.clear();
    cache_map_.clear();
}

}
