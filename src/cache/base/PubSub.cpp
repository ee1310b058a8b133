#include "flycache/cache/base/PubSub.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/base/GlobPattern.hpp"

namespace flycache {
namespace cache {

std::string channelForPattern(const std::string& pattern, const std::string& adapter) {
    if (pattern.empty()) {
        throw ValidationError("Channel pattern must not be empty", "pattern", "non-empty", adapter);
    }
    if (globHasClassOrEscape(pattern)) {
        throw ValidationError("Channel pattern '" + pattern + "' cannot be published on",
                              "pattern", "no '[' classes or '\\' escapes", adapter);
    }
    return pattern;
}

} // namespace cache
} // namespace flycache
