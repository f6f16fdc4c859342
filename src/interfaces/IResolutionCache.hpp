#pragma once
#include <string>
#include "../model/Entities.hpp"

namespace Anime1Relay {

class IResolutionCache {
public:
    virtual ~IResolutionCache() = default;
    virtual ResolvedVideo GetOrResolve(const std::string& post_id) = 0;
    virtual void Clear() = 0;
};

}
