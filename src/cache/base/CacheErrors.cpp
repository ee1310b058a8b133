#include "flycache/cache/base/CacheErrors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace flycache {
namespace cache {

namespace {

std::string withOriginal(const std::string& message, const std::string& originalError) {
    if (originalError.empty()) {
        return message;
    }
    return message + ": " + originalError;
}

} // namespace

CacheError::CacheError(const std::string& message, std::string adapter)
    : std::runtime_error(message)
    , adapter_(std::move(adapter)) {
}

ValidationError::ValidationError(const std::string& message, std::string field,
                                 std::string constraint, std::string adapter)
    : CacheError(message, std::move(adapter))
    , field_(std::move(field))
    , constraint_(std::move(constraint)) {
}

ConnectionError::ConnectionError(const std::string& message, std::string host, int port,
                                 std::string reason, std::string adapter)
    : CacheError(withOriginal(message, reason), std::move(adapter))
    , host_(std::move(host))
    , port_(port)
    , reason_(std::move(reason)) {
}

OperationError::OperationError(const std::string& message, std::string method, std::string key,
                               std::optional<double> ttl, std::string originalError,
                               std::string adapter)
    : CacheError(withOriginal(message, originalError), std::move(adapter))
    , method_(std::move(method))
    , key_(std::move(key))
    , ttl_(ttl)
    , originalError_(std::move(originalError)) {
}

void validateKey(const std::string& key, const std::string& adapter) {
    const bool blank = std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (key.empty() || blank) {
        throw ValidationError("Cache key cannot be empty", "key", "key.length > 0", adapter);
    }
}

void validateTtl(const std::optional<double>& ttlSeconds, const std::string& adapter) {
    if (!ttlSeconds) {
        return;
    }
    if (!std::isfinite(*ttlSeconds) || *ttlSeconds < 0.0) {
        throw ValidationError("TTL must be a finite, non-negative number of seconds", "ttl",
                              "ttl >= 0 && isfinite(ttl)", adapter);
    }
}

bool expiresAfter(const std::optional<double>& ttlSeconds) {
    return ttlSeconds && *ttlSeconds > 0.0 && *ttlSeconds <= kMaxExpiringTtlSeconds;
}

} // namespace cache
} // namespace flycache
