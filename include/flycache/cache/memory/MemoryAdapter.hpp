#pragma once

#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "flycache/cache/base/CacheAdapter.hpp"
#include "flycache/cache/memory/ExpiryScheduler.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Ограниченный in-memory адаптер с LRU-вытеснением и TTL.
 * @details Порядок использования хранится в списке (давно не использованные
 * в начале). Истечение проверяется при get() и дополнительно выполняется
 * ExpiryScheduler, так что непрочитанные ключи тоже удаляются. Вытеснение
 * идет только по числу записей; оценка размера нужна для статистики.
 * TTL больше kMaxExpiringTtlSeconds делает запись бессрочной.
 *
 * @note Потокобезопасен
 */
class MemoryAdapter : public CacheAdapter {
public:
    using Clock = std::chrono::steady_clock;

    explicit MemoryAdapter(const MemoryAdapterConfig& config = MemoryAdapterConfig{});
    ~MemoryAdapter() override;

    MemoryAdapter(const MemoryAdapter&) = delete;
    MemoryAdapter& operator=(const MemoryAdapter&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<double> ttlSeconds = std::nullopt) override;
    bool del(const std::string& key) override;
    std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys) override;
    void mset(const std::vector<BatchEntry>& entries) override;
    std::vector<std::string> keys(const std::optional<std::string>& pattern = std::nullopt) override;
    size_t clear(const std::optional<std::string>& pattern = std::nullopt) override;
    CacheStats getStats() override;

    void disconnect() override;
    HealthStatus healthCheck() override;
    void setEvictionCallback(EvictionCallback callback) override;
    std::string name() const override { return "MemoryAdapter"; }

    size_t size() const;
    size_t capacity() const { return maxEntries_; }
    // Количество активных таймеров истечения
    size_t pendingExpiries() const;

    /// 2 * (длина ключа + длина значения) + 40 байт.
    static size_t estimateSize(const std::string& key, const std::string& value);

private:
    struct Entry {
        std::string value;
        Clock::time_point expiresAt;   // time_point{} = без истечения
        size_t size = 0;
        uint64_t timerToken = 0;       // 0 = таймер не запланирован
    };
    using LruList = std::list<std::string>;
    using EntryMap = std::unordered_map<std::string, std::pair<LruList::iterator, Entry>>;
    using EvictedKeys = std::vector<std::pair<std::string, EvictionReason>>;

    static bool isExpired(const Entry& entry, Clock::time_point now);
    void removeLocked(EntryMap::iterator it);
    void evictLRULocked(EvictedKeys& evicted);
    void onTimerFired(const std::string& key, uint64_t token);
    void notifyEvictions(const EvictedKeys& evicted);

    size_t maxEntries_;
    std::optional<double> defaultTtlSeconds_;
    EntryMap cache_;
    LruList lruList_;
    mutable std::shared_mutex mutex_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t memoryUsage_ = 0;
    const Clock::time_point startTime_;

    EvictionCallback evictionCallback_;
    std::mutex callbackMutex_;

    std::unique_ptr<ExpiryScheduler> scheduler_;
};

} // namespace cache
} // namespace flycache
