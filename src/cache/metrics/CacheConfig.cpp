#include "flycache/cache/metrics/CacheConfig.hpp"
#include <algorithm>
#include <cmath>

namespace flycache {
namespace cache {

bool MemoryAdapterConfig::validate() const {
    if (maxEntries == 0) return false;
    if (defaultTtlSeconds && (!std::isfinite(*defaultTtlSeconds) || *defaultTtlSeconds < 0.0)) {
        return false;
    }
    return true;
}

MemoryAdapterConfig MemoryAdapterConfig::fromJson(const nlohmann::json& j) {
    MemoryAdapterConfig config;
    config.maxEntries = j.value("maxEntries", config.maxEntries);
    if (j.contains("defaultTtlSeconds") && !j.at("defaultTtlSeconds").is_null()) {
        config.defaultTtlSeconds = j.at("defaultTtlSeconds").get<double>();
    }
    return config;
}

RetryStrategy defaultRetryStrategy() {
    return [](unsigned attempt) -> std::optional<std::chrono::milliseconds> {
        if (attempt > 10) {
            return std::nullopt;
        }
        const unsigned shift = std::min(attempt == 0 ? 0u : attempt - 1, 16u);
        const long long delay = std::min(50LL << shift, 2000LL);
        return std::chrono::milliseconds(delay);
    };
}

bool RedisAdapterConfig::validate() const {
    if (host.empty()) return false;
    if (port <= 0 || port > 65535) return false;
    if (db < 0) return false;
    if (connectTimeout.count() <= 0 || commandTimeout.count() <= 0) return false;
    return true;
}

RetryStrategy RedisAdapterConfig::effectiveRetryStrategy() const {
    if (retryStrategy) {
        return retryStrategy;
    }
    return defaultRetryStrategy();
}

RedisAdapterConfig RedisAdapterConfig::fromJson(const nlohmann::json& j) {
    RedisAdapterConfig config;
    config.host = j.value("host", config.host);
    config.port = j.value("port", config.port);
    config.username = j.value("username", config.username);
    config.password = j.value("password", config.password);
    config.db = j.value("db", config.db);
    config.connectTimeout = std::chrono::milliseconds(
        j.value("connectTimeoutMs", static_cast<long long>(config.connectTimeout.count())));
    config.commandTimeout = std::chrono::milliseconds(
        j.value("commandTimeoutMs", static_cast<long long>(config.commandTimeout.count())));
    config.maxRetriesPerRequest = j.value("maxRetriesPerRequest", config.maxRetriesPerRequest);
    config.enableOfflineQueue = j.value("enableOfflineQueue", config.enableOfflineQueue);
    return config;
}

CacheServiceConfig CacheServiceConfig::fromJson(const nlohmann::json& j) {
    CacheServiceConfig config;
    config.originId = j.value("originId", config.originId);
    config.channelPattern = j.value("channelPattern", config.channelPattern);
    config.publishQueueSize = j.value("publishQueueSize", config.publishQueueSize);
    return config;
}

} // namespace cache
} // namespace flycache
