#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

// Конфигурация in-memory адаптера
struct MemoryAdapterConfig {
    size_t maxEntries = 1000;
    std::optional<double> defaultTtlSeconds;  // отсутствует = без истечения

    bool validate() const;
    static MemoryAdapterConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Стратегия повторов: номер попытки (с 1) -> задержка перед следующей,
 * std::nullopt = прекратить попытки.
 */
using RetryStrategy = std::function<std::optional<std::chrono::milliseconds>(unsigned attempt)>;

/// Экспоненциальная задержка min(50ms * 2^(attempt-1), 2000ms), не более 10 попыток.
RetryStrategy defaultRetryStrategy();

// Конфигурация подключения к Redis
struct RedisAdapterConfig {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string username;                 // пусто = AUTH только с паролем
    std::string password;                 // пусто = без AUTH
    int db = 0;
    RetryStrategy retryStrategy;          // пусто = defaultRetryStrategy()
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds commandTimeout{5000};
    unsigned maxRetriesPerRequest = 3;
    bool enableOfflineQueue = true;

    bool validate() const;

    // Стратегия повторов с учетом значения по умолчанию
    RetryStrategy effectiveRetryStrategy() const;

    /// Загружает все поля, кроме стратегии повторов (задается только в коде).
    static RedisAdapterConfig fromJson(const nlohmann::json& j);
};

// Конфигурация координатора кэша
struct CacheServiceConfig {
    std::string originId;                 // обязателен при наличии PubSub
    std::string channelPattern = "cache:*";
    size_t publishQueueSize = 1024;

    bool validate() const {
        return !channelPattern.empty() && publishQueueSize > 0;
    }

    static CacheServiceConfig fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace flycache
