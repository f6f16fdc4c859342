#pragma once
#include <string>
#include <vector>
#include "../model/Entities.hpp"

namespace Anime1Relay {

enum class PageKind {
    Category,
    SinglePost,
    Unknown
};

class IPageExtractor {
public:
    virtual ~IPageExtractor() = default;
    virtual PageKind Classify(const std::string& html) = 0;
    virtual std::vector<Post> ExtractPosts(const std::string& html) = 0;
    virtual Category ExtractCategory(const std::string& html) = 0;
};

}
