#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include "../model/Entities.hpp"
#include "IHttpTransport.hpp"

namespace Anime1Relay {

// monostate: the page is neither a category nor a single post.
using PageContent = std::variant<std::monostate, Post, Category>;

class IUpstreamClient {
public:
    virtual ~IUpstreamClient() = default;
    virtual PageContent FetchPostsOrCategory(const std::string& url) = 0;
    virtual std::optional<Category> FetchCategory(const std::string& category_id) = 0;
    virtual std::optional<Post> FetchPost(const std::string& post_id) = 0;
    virtual ResolvedVideo ResolveVideo(const std::string& resolution_token) = 0;
    virtual void Preheat() = 0;
    virtual void ResetConnection() = 0;
};

}
