#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "flycache/cache/base/CacheAdapter.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"
#include "flycache/cache/redis/RedisConnection.hpp"
#include "flycache/cache/redis/RedisPubSub.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Адаптер кэша поверх сервера Redis.
 * @details Ключи и TTL проверяются до обращения к сети. Истечение и вытеснение
 * выполняет сервер, поэтому обратный вызов вытеснения не вызывается.
 * Счетчики попаданий и промахов локальны для процесса; объем памяти,
 * число ключей и вытеснения берутся из INFO.
 *
 * @note Потокобезопасен (команды сериализуются соединением)
 */
class RedisAdapter : public CacheAdapter {
public:
    explicit RedisAdapter(const RedisAdapterConfig& config = RedisAdapterConfig{});
    ~RedisAdapter() override;

    RedisAdapter(const RedisAdapter&) = delete;
    RedisAdapter& operator=(const RedisAdapter&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<double> ttlSeconds = std::nullopt) override;
    bool del(const std::string& key) override;
    std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys) override;
    void mset(const std::vector<BatchEntry>& entries) override;
    std::vector<std::string> keys(const std::optional<std::string>& pattern = std::nullopt) override;
    size_t clear(const std::optional<std::string>& pattern = std::nullopt) override;
    CacheStats getStats() override;

    /// @throws ConnectionError если стратегия повторов исчерпана
    void connect() override;
    void disconnect() override;
    HealthStatus healthCheck() override;
    std::string name() const override { return "RedisAdapter"; }

    /// Транспорт pub/sub с теми же настройками соединения, еще не подключенный.
    std::shared_ptr<RedisPubSub> createPubSub(const std::string& originId) const;

    ConnectionState state() const { return connection_->state(); }
    const RedisAdapterConfig& config() const { return config_; }

    /// Аргумент PSETEX: TTL в миллисекундах с округлением, не меньше 1 и не больше kMaxExpiringTtlSeconds.
    static long long ttlToMilliseconds(double ttlSeconds);

    /// @throws OperationError если ответ MGET не массив из keyCount элементов
    static void checkMgetReply(const RedisReply& reply, size_t keyCount);

private:
    // SCAN по шаблону; обработчик получает каждую порцию ключей
    template <typename Visitor>
    void scan(const std::string& pattern, Visitor&& visit);

    RedisAdapterConfig config_;
    std::unique_ptr<RedisConnection> connection_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::chrono::steady_clock::time_point startTime_;
};

} // namespace cache
} // namespace flycache
