#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "interfaces/IHttpTransport.hpp"
#include "interfaces/IUpstreamClient.hpp"

namespace Anime1Relay {
namespace Testing {

class FakeStream : public IHttpStream {
public:
    FakeStream(long status, HeaderMap headers, std::vector<std::string> chunks)
        : status_(status), headers_(std::move(headers)), chunks_(std::move(chunks)) {}

    long StatusCode() const override { return status_; }
    const HeaderMap& Headers() const override { return headers_; }
    bool ReadChunk(std::string& chunk) override {
        if (next_ >= chunks_.size()) return false;
        chunk = chunks_[next_++];
        return true;
    }

private:
    long status_;
    HeaderMap headers_;
    std::vector<std::string> chunks_;
    size_t next_ = 0;
};

// Records every request; answers from per-URL pages or the handlers below.
class FakeTransport : public IHttpTransport {
public:
    std::map<std::string, std::string> pages;
    std::function<HttpResponse(const HttpRequest&)> on_perform;
    std::function<std::unique_ptr<IHttpStream>(const HttpRequest&)> on_stream;

    std::vector<HttpRequest> requests;
    int preheats = 0;
    int resets = 0;

    HttpResponse Perform(const HttpRequest& request) override {
        requests.push_back(request);
        if (on_perform) return on_perform(request);
        auto it = pages.find(request.url);
        if (it == pages.end()) {
            throw std::runtime_error("unexpected request to " + request.url);
        }
        HttpResponse response;
        response.status_code = 200;
        response.body = it->second;
        return response;
    }

    std::unique_ptr<IHttpStream> OpenStream(const HttpRequest& request) override {
        requests.push_back(request);
        if (!on_stream) throw std::runtime_error("unexpected stream of " + request.url);
        return on_stream(request);
    }

    void Preheat() override { ++preheats; }
    void Reset() override { ++resets; }
};

// In-memory upstream: posts and categories by id, resolution with a fixed lifetime.
class FakeUpstream : public IUpstreamClient {
public:
    std::map<std::string, Post> posts;
    std::map<std::string, Category> categories;
    PageContent page;

    std::function<std::int64_t()> clock = [] { return std::int64_t{1000}; };
    std::int64_t lifetime = 3600;
    std::string backing_base = "https://v.anime1.me/";
    std::chrono::milliseconds resolve_delay{0};
    bool fail_resolution = false;

    std::atomic<int> resolve_calls{0};
    std::atomic<int> category_fetches{0};
    int resets = 0;
    int preheats = 0;

    PageContent FetchPostsOrCategory(const std::string&) override { return page; }

    std::optional<Category> FetchCategory(const std::string& category_id) override {
        ++category_fetches;
        auto it = categories.find(category_id);
        if (it == categories.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Post> FetchPost(const std::string& post_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = posts.find(post_id);
        if (it == posts.end()) return std::nullopt;
        return it->second;
    }

    ResolvedVideo ResolveVideo(const std::string& resolution_token) override {
        ++resolve_calls;
        if (resolve_delay.count() > 0) std::this_thread::sleep_for(resolve_delay);
        if (fail_resolution) throw std::runtime_error("resolution refused");
        ResolvedVideo video;
        video.backing_url = backing_base + resolution_token + ".mp4";
        video.media_type = "video/mp4";
        video.session_cookies = {{"e", std::to_string(clock() + lifetime)}, {"p", "token"}};
        video.expires_at = clock() + lifetime;
        return video;
    }

    void Preheat() override { ++preheats; }
    void ResetConnection() override { ++resets; }

    void AddPost(const std::string& id, const std::string& title = "Episode") {
        Post post;
        post.id = id;
        post.title = title;
        post.resolution_token = "tok-" + id;
        std::lock_guard<std::mutex> lock(mutex_);
        posts[id] = post;
    }

private:
    std::mutex mutex_;
};

inline Post MakePost(const std::string& id, const std::string& title) {
    Post post;
    post.id = id;
    post.title = title;
    return post;
}

}
}
