#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Anime1Relay {

    // One playable episode page.
    struct Post {
        std::string id;
        std::string title;
        std::optional<int> order; // from a leading "[N]" in the title
        std::string timestamp;
        std::string category_id;
        std::string video_id;
        std::string thumbnails_server;
        std::string resolution_token; // percent-decoded data-apireq
        std::optional<std::string> next_post_id;
    };

    struct Category {
        std::string id;
        std::string title;
        std::vector<Post> posts;
    };

    using CookieMap = std::map<std::string, std::string>;

    // A short-lived backing URL together with the cookies that unlock it.
    struct ResolvedVideo {
        std::string backing_url;
        std::string media_type;
        CookieMap session_cookies;
        std::int64_t expires_at = 0; // epoch seconds
    };

}
