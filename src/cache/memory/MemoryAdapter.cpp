#include "flycache/cache/memory/MemoryAdapter.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/base/GlobPattern.hpp"
#include "flycache/logging/Logging.hpp"
#include <iterator>

namespace flycache {
namespace cache {

namespace {

const char* kLoggerName = "memoryadapter";

} // namespace

MemoryAdapter::MemoryAdapter(const MemoryAdapterConfig& config)
    : maxEntries_(config.maxEntries)
    , defaultTtlSeconds_(config.defaultTtlSeconds)
    , startTime_(Clock::now()) {
    if (!config.validate()) {
        throw ValidationError("Invalid memory adapter configuration", "config",
                              "maxEntries > 0 && defaultTtlSeconds >= 0", name());
    }

    scheduler_ = std::make_unique<ExpiryScheduler>(
        [this](const std::string& key, uint64_t token) { onTimerFired(key, token); });

    logging::getLogger(kLoggerName)->info(
        "MemoryAdapter initialized: maxEntries={}, defaultTtl={}",
        maxEntries_, defaultTtlSeconds_ ? std::to_string(*defaultTtlSeconds_) : "none");
}

MemoryAdapter::~MemoryAdapter() {
    // Таймеры обращаются к адаптеру, поэтому поток останавливается первым
    scheduler_->stop();
}

std::optional<std::string> MemoryAdapter::get(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        ++misses_;
        return std::nullopt;
    }

    // Пассивная проверка истечения
    if (isExpired(it->second.second, Clock::now())) {
        removeLocked(it);
        ++misses_;
        return std::nullopt;
    }

    lruList_.splice(lruList_.end(), lruList_, it->second.first);
    ++hits_;
    return it->second.second.value;
}

void MemoryAdapter::set(const std::string& key, const std::string& value,
                        std::optional<double> ttlSeconds) {
    validateTtl(ttlSeconds, name());

    EvictedKeys evicted;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto existing = cache_.find(key);
        if (existing != cache_.end()) {
            removeLocked(existing);
        }

        while (!cache_.empty() && cache_.size() >= maxEntries_) {
            evictLRULocked(evicted);
        }

        const std::optional<double> effectiveTtl = ttlSeconds ? ttlSeconds : defaultTtlSeconds_;

        Entry entry;
        entry.value = value;
        entry.size = estimateSize(key, value);
        // TTL за пределами диапазона часов не переводится в time_point: запись бессрочная
        if (expiresAfter(effectiveTtl)) {
            entry.expiresAt = Clock::now() + std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double>(*effectiveTtl));
            entry.timerToken = scheduler_->schedule(key, entry.expiresAt);
        }

        memoryUsage_ += entry.size;
        lruList_.push_back(key);
        cache_.emplace(key, std::make_pair(std::prev(lruList_.end()), std::move(entry)));
    }

    notifyEvictions(evicted);
}

bool MemoryAdapter::del(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) {
        return false;
    }

    // Истекшая запись считается уже отсутствующей
    const bool live = !isExpired(it->second.second, Clock::now());
    removeLocked(it);
    return live;
}

std::vector<std::optional<std::string>> MemoryAdapter::mget(const std::vector<std::string>& keys) {
    std::vector<std::optional<std::string>> results;
    results.reserve(keys.size());
    for (const auto& key : keys) {
        results.push_back(get(key));
    }
    return results;
}

void MemoryAdapter::mset(const std::vector<BatchEntry>& entries) {
    for (const auto& entry : entries) {
        set(entry.key, entry.value, entry.ttlSeconds);
    }
}

std::vector<std::string> MemoryAdapter::keys(const std::optional<std::string>& pattern) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const auto now = Clock::now();
    std::vector<std::string> result;
    for (const auto& key : lruList_) {
        const auto& entry = cache_.at(key).second;
        if (isExpired(entry, now)) {
            continue;
        }
        if (!pattern || globMatch(*pattern, key)) {
            result.push_back(key);
        }
    }
    return result;
}

size_t MemoryAdapter::clear(const std::optional<std::string>& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t removed = 0;
    for (auto listIt = lruList_.begin(); listIt != lruList_.end();) {
        const std::string key = *listIt;
        ++listIt;
        if (pattern && !globMatch(*pattern, key)) {
            continue;
        }
        removeLocked(cache_.find(key));
        ++removed;
    }

    logging::getLogger(kLoggerName)->debug("Cleared {} entries (pattern={})",
                                           removed, pattern ? *pattern : "*");
    return removed;
}

CacheStats MemoryAdapter::getStats() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.memoryUsage = memoryUsage_;
    stats.entryCount = cache_.size();
    stats.uptime = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - startTime_).count());
    return stats;
}

void MemoryAdapter::disconnect() {
    scheduler_->cancelAll();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.clear();
    lruList_.clear();
    memoryUsage_ = 0;

    logging::getLogger(kLoggerName)->info("MemoryAdapter disconnected, store cleared");
}

HealthStatus MemoryAdapter::healthCheck() {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    HealthStatus status;
    status.healthy = true;
    status.message = "In-memory adapter operational";
    status.details = {
        {"entryCount", cache_.size()},
        {"maxEntries", maxEntries_},
        {"memoryUsage", memoryUsage_}
    };
    return status;
}

void MemoryAdapter::setEvictionCallback(EvictionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    evictionCallback_ = std::move(callback);
}

size_t MemoryAdapter::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return cache_.size();
}

size_t MemoryAdapter::pendingExpiries() const {
    return scheduler_->pending();
}

size_t MemoryAdapter::estimateSize(const std::string& key, const std::string& value) {
    constexpr size_t overhead = 40;
    return key.size() * 2 + value.size() * 2 + overhead;
}

bool MemoryAdapter::isExpired(const Entry& entry, Clock::time_point now) {
    return entry.expiresAt != Clock::time_point{} && now >= entry.expiresAt;
}

void MemoryAdapter::removeLocked(EntryMap::iterator it) {
    if (it == cache_.end()) {
        return;
    }
    if (it->second.second.timerToken != 0) {
        scheduler_->cancel(it->second.second.timerToken);
    }
    memoryUsage_ -= it->second.second.size;
    lruList_.erase(it->second.first);
    cache_.erase(it);
}

void MemoryAdapter::evictLRULocked(EvictedKeys& evicted) {
    if (lruList_.empty()) {
        return;
    }

    const std::string victim = lruList_.front();
    removeLocked(cache_.find(victim));
    ++evictions_;
    evicted.emplace_back(victim, EvictionReason::Lru);

    logging::getLogger(kLoggerName)->debug("LRU eviction: key={}", victim);
}

void MemoryAdapter::onTimerFired(const std::string& key, uint64_t token) {
    EvictedKeys expired;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = cache_.find(key);
        // Запись была заменена или удалена: таймер устарел
        if (it == cache_.end() || it->second.second.timerToken != token) {
            return;
        }
        removeLocked(it);
        expired.emplace_back(key, EvictionReason::Ttl);
    }

    logging::getLogger(kLoggerName)->debug("TTL expiry: key={}", key);
    notifyEvictions(expired);
}

void MemoryAdapter::notifyEvictions(const EvictedKeys& evicted) {
    if (evicted.empty()) {
        return;
    }

    EvictionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = evictionCallback_;
    }
    if (!callback) {
        return;
    }

    for (const auto& [key, reason] : evicted) {
        try {
            callback(key, reason);
        } catch (const std::exception& e) {
            logging::getLogger(kLoggerName)->error(
                "Eviction callback failed for key '{}': {}", key, e.what());
        }
    }
}

} // namespace cache
} // namespace flycache
