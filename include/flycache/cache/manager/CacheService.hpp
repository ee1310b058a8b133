#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "flycache/cache/base/CacheAdapter.hpp"
#include "flycache/cache/base/PubSub.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"
#include "flycache/thread/ThreadPool.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Координатор кэша: адаптер + локальные наблюдатели + межпроцессная рассылка.
 *
 * Изменение сначала применяется к адаптеру. Только после успеха событие со
 * следующим локальным sequence доставляется подходящим наблюдателям в
 * вызывающем потоке и затем передается потоку публикации в порядке sequence.
 * События других процессов проходят ту же локальную доставку и повторно не
 * публикуются; события с originId этого процесса отбрасываются.
 *
 * Обработчики могут обращаться к сервису, в том числе к watch() и к
 * возвращенным функциям отписки. Разрушать сервис из обработчика нельзя.
 */
class CacheService {
public:
    using EventHandler = std::function<void(const CacheChangeEvent& event)>;
    using Unsubscribe = std::function<void()>;

    /**
     * @throws ValidationError если адаптер пуст, конфигурация некорректна
     *         либо PubSub передан без originId
     */
    explicit CacheService(std::shared_ptr<CacheAdapter> adapter,
                          std::shared_ptr<PubSub> pubsub = nullptr,
                          CacheServiceConfig config = CacheServiceConfig{});
    ~CacheService();

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    // Подписка на канал межпроцессных событий (без PubSub ничего не делает)
    void init();

    // Подключение адаптера, затем PubSub
    void connect();

    // Отписка, ожидание публикаций, отключение PubSub и адаптера
    void disconnect();

    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, const std::string& value,
             std::optional<double> ttlSeconds = std::nullopt);
    bool del(const std::string& key);
    std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys);
    void mset(const std::vector<BatchEntry>& entries);
    std::vector<std::string> keys(const std::optional<std::string>& pattern = std::nullopt);

    /// Удаляет подходящие ключи, по одному событию delete на каждый.
    size_t clear(const std::optional<std::string>& pattern = std::nullopt);

    CacheStats getStats();
    HealthStatus healthCheck();

    /**
     * @brief Наблюдение за событиями с ключом, равным `key`.
     * @return идемпотентная функция отписки
     */
    Unsubscribe watch(const std::string& key, EventHandler handler);

    /// Наблюдение за событиями, ключ которых содержит совпадение с `pattern` (regex_search).
    Unsubscribe watch(const std::regex& pattern, EventHandler handler);

    // Блокирует до опустошения очереди публикаций
    void waitForPendingPublishes();

    const std::string& originId() const { return config_.originId; }
    size_t watcherCount() const;

private:
    struct Watcher {
        uint64_t id;
        std::function<bool(const std::string& key)> matches;
        EventHandler handler;
    };

    struct WatcherRegistry {
        std::mutex mutex;
        std::vector<Watcher> watchers;
        uint64_t nextId = 1;
    };

    // Связь обратных вызовов адаптера и PubSub с сервисом; деструктор обнуляет owner
    // и ждет, пока active не станет 0
    struct Lifeline {
        std::mutex mutex;
        std::condition_variable idle;
        CacheService* owner = nullptr;
        size_t active = 0;
    };

    class LifelineGuard;

    Unsubscribe addWatcher(std::function<bool(const std::string&)> matches, EventHandler handler);
    CacheChangeEvent makeEvent(ChangeType type, const std::string& key,
                               std::optional<std::string> value, const std::string& timestamp);
    void emit(const CacheChangeEvent& event);
    void dispatchLocal(const CacheChangeEvent& event);
    void publishInOrder(const CacheChangeEvent& event);
    void enqueuePublish(const CacheChangeEvent& event);
    void onRemoteEvent(const CacheChangeEvent& event);
    void onAdapterEviction(const std::string& key, EvictionReason reason);

    std::shared_ptr<CacheAdapter> adapter_;
    std::shared_ptr<PubSub> pubsub_;
    CacheServiceConfig config_;
    std::shared_ptr<WatcherRegistry> registry_;
    std::shared_ptr<Lifeline> lifeline_;
    std::atomic<uint64_t> sequence_{0};
    std::unique_ptr<thread::ThreadPool> publisher_;
    // События ждут здесь, пока не будут поставлены в очередь все с меньшим sequence
    std::mutex publishOrderMutex_;
    std::map<uint64_t, CacheChangeEvent> staged_;
    uint64_t nextToPublish_ = 1;
    std::mutex subscriptionMutex_;
    Unsubscribe remoteSubscription_;
    std::atomic<bool> disconnected_{false};
};

} // namespace cache
} // namespace flycache
