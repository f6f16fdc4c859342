#pragma once
#include <optional>
#include <string>
#include "../../config/Config.hpp"
#include "../interfaces/IHttpTransport.hpp"
#include "../interfaces/IPageExtractor.hpp"
#include "../interfaces/IUpstreamClient.hpp"

namespace Anime1Relay {

    class UpstreamClient : public IUpstreamClient {
    public:
        static constexpr const char* kMainHost = "anime1.me";
        static constexpr const char* kMainUrl = "https://anime1.me";
        static constexpr const char* kApiUrl = "https://v.anime1.me/api";
        static constexpr int kExpireOffsetSeconds = 5;

        UpstreamClient(const Config& config, IHttpTransport& transport, IPageExtractor& extractor);

        // Throws InvalidUrl for hosts other than anime1.me without touching the network.
        PageContent FetchPostsOrCategory(const std::string& url) override;
        std::optional<Category> FetchCategory(const std::string& category_id) override;
        std::optional<Post> FetchPost(const std::string& post_id) override;
        ResolvedVideo ResolveVideo(const std::string& resolution_token) override;
        void Preheat() override;
        void ResetConnection() override;

        static bool IsValidPostsUrl(const std::string& url);

        HeaderList PageHeaders() const;
        HeaderList ApiHeaders() const;
        HeaderList VideoHeaders(const std::optional<std::string>& range,
                                const std::optional<std::string>& if_range) const;

    private:
        std::string FetchPage(const std::string& url);

        const Config& config_;
        IHttpTransport& transport_;
        IPageExtractor& extractor_;
    };

}
