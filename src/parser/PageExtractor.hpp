#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../interfaces/IPageExtractor.hpp"

namespace Anime1Relay {

    // Scrapes anime1.me category and post pages. A block that lacks one of its
    // required elements fails the whole page with MalformedPage.
    class PageExtractor : public IPageExtractor {
    public:
        PageKind Classify(const std::string& html) override;
        std::vector<Post> ExtractPosts(const std::string& html) override;
        Category ExtractCategory(const std::string& html) override;

        // Number inside the first "[N]" of a title, if any.
        static std::optional<int> ParseOrder(const std::string& title);
        // Sorts by order when every post has one, otherwise reverses page order.
        static void ApplyCanonicalOrder(std::vector<Post>& posts);
    };

}
