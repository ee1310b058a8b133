#include "flycache/cache/manager/CacheService.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/logging/Logging.hpp"
#include <algorithm>

namespace flycache {
namespace cache {

namespace {

const char* kLoggerName = "cacheservice";
const char* kComponentName = "CacheService";

} // namespace

// Удерживает сервис живым на время одного обратного вызова
class CacheService::LifelineGuard {
public:
    explicit LifelineGuard(const std::weak_ptr<Lifeline>& weak)
        : lifeline_(weak.lock()) {
        if (!lifeline_) {
            return;
        }
        std::lock_guard<std::mutex> lock(lifeline_->mutex);
        owner_ = lifeline_->owner;
        if (owner_) {
            ++lifeline_->active;
        }
    }

    ~LifelineGuard() {
        if (!owner_) {
            return;
        }
        std::lock_guard<std::mutex> lock(lifeline_->mutex);
        if (--lifeline_->active == 0) {
            lifeline_->idle.notify_all();
        }
    }

    LifelineGuard(const LifelineGuard&) = delete;
    LifelineGuard& operator=(const LifelineGuard&) = delete;

    CacheService* owner() const { return owner_; }

private:
    std::shared_ptr<Lifeline> lifeline_;
    CacheService* owner_ = nullptr;
};

CacheService::CacheService(std::shared_ptr<CacheAdapter> adapter,
                           std::shared_ptr<PubSub> pubsub,
                           CacheServiceConfig config)
    : adapter_(std::move(adapter))
    , pubsub_(std::move(pubsub))
    , config_(std::move(config))
    , registry_(std::make_shared<WatcherRegistry>())
    , lifeline_(std::make_shared<Lifeline>()) {
    if (!adapter_) {
        throw ValidationError("CacheService requires an adapter", "adapter", "non-null",
                              kComponentName);
    }
    if (!config_.validate()) {
        throw ValidationError("Invalid cache service configuration", "config",
                              "channelPattern non-empty, publishQueueSize > 0", kComponentName);
    }

    if (pubsub_) {
        if (config_.originId.empty()) {
            throw ValidationError("originId is required when a PubSub channel is configured",
                                  "originId", "non-empty with pubsub", kComponentName);
        }
        channelForPattern(config_.channelPattern, kComponentName);

        thread::ThreadPoolConfig poolConfig;
        poolConfig.threadCount = 1;
        poolConfig.queueSize = config_.publishQueueSize;
        poolConfig.name = "threadpool";
        publisher_ = std::make_unique<thread::ThreadPool>(poolConfig);
    }

    lifeline_->owner = this;
    std::weak_ptr<Lifeline> weak = lifeline_;
    adapter_->setEvictionCallback([weak](const std::string& key, EvictionReason reason) {
        LifelineGuard guard(weak);
        if (guard.owner()) {
            guard.owner()->onAdapterEviction(key, reason);
        }
    });

    logging::getLogger(kLoggerName)->info("CacheService created: adapter={}, pubsub={}, origin='{}'",
                                          adapter_->name(), pubsub_ ? "yes" : "no",
                                          config_.originId);
}

CacheService::~CacheService() {
    // Адаптер и PubSub могут пережить сервис: отсекаем новые вызовы и ждем текущие
    {
        std::unique_lock<std::mutex> lock(lifeline_->mutex);
        lifeline_->owner = nullptr;
        lifeline_->idle.wait(lock, [this] { return lifeline_->active == 0; });
    }
    adapter_->setEvictionCallback(nullptr);

    Unsubscribe subscription;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscription = std::move(remoteSubscription_);
        remoteSubscription_ = nullptr;
    }
    if (subscription) {
        subscription();
    }

    // Пул дожидается уже поставленных публикаций в деструкторе
    publisher_.reset();
}

void CacheService::init() {
    if (!pubsub_) {
        return;
    }

    std::lock_guard<std::mutex> lock(subscriptionMutex_);
    if (remoteSubscription_) {
        return;
    }
    std::weak_ptr<Lifeline> weak = lifeline_;
    remoteSubscription_ = pubsub_->subscribe(config_.channelPattern,
        [weak](const CacheChangeEvent& event) {
            LifelineGuard guard(weak);
            if (guard.owner()) {
                guard.owner()->onRemoteEvent(event);
            }
        });

    logging::getLogger(kLoggerName)->info("Subscribed to {}", config_.channelPattern);
}

void CacheService::connect() {
    adapter_->connect();
    if (pubsub_) {
        pubsub_->connect();
    }
}

void CacheService::disconnect() {
    if (disconnected_.exchange(true)) {
        return;
    }
    auto logger = logging::getLogger(kLoggerName);

    Unsubscribe subscription;
    {
        std::lock_guard<std::mutex> lock(subscriptionMutex_);
        subscription = std::move(remoteSubscription_);
        remoteSubscription_ = nullptr;
    }
    if (subscription) {
        subscription();
    }

    if (publisher_) {
        publisher_->waitForCompletion();
        publisher_->stop();
    }

    if (pubsub_) {
        try {
            pubsub_->disconnect();
        } catch (const std::exception& e) {
            logger->error("PubSub disconnect failed: {}", e.what());
        }
    }
    try {
        adapter_->disconnect();
    } catch (const std::exception& e) {
        logger->error("Adapter disconnect failed: {}", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        registry_->watchers.clear();
    }
    logger->info("CacheService disconnected");
}

std::optional<std::string> CacheService::get(const std::string& key) {
    return adapter_->get(key);
}

void CacheService::set(const std::string& key, const std::string& value,
                       std::optional<double> ttlSeconds) {
    adapter_->set(key, value, ttlSeconds);
    emit(makeEvent(ChangeType::Set, key, value, currentTimestamp()));
}

bool CacheService::del(const std::string& key) {
    const bool existed = adapter_->del(key);
    if (existed) {
        emit(makeEvent(ChangeType::Delete, key, std::nullopt, currentTimestamp()));
    }
    return existed;
}

std::vector<std::optional<std::string>> CacheService::mget(const std::vector<std::string>& keys) {
    return adapter_->mget(keys);
}

void CacheService::mset(const std::vector<BatchEntry>& entries) {
    adapter_->mset(entries);

    const std::string timestamp = currentTimestamp();
    for (const auto& entry : entries) {
        emit(makeEvent(ChangeType::Set, entry.key, entry.value, timestamp));
    }
}

std::vector<std::string> CacheService::keys(const std::optional<std::string>& pattern) {
    return adapter_->keys(pattern);
}

size_t CacheService::clear(const std::optional<std::string>& pattern) {
    size_t removed = 0;
    for (const auto& key : adapter_->keys(pattern)) {
        if (del(key)) {
            ++removed;
        }
    }

    logging::getLogger(kLoggerName)->debug("Cleared {} keys (pattern={})",
                                           removed, pattern ? *pattern : "*");
    return removed;
}

CacheStats CacheService::getStats() {
    return adapter_->getStats();
}

HealthStatus CacheService::healthCheck() {
    return adapter_->healthCheck();
}

CacheService::Unsubscribe CacheService::watch(const std::string& key, EventHandler handler) {
    return addWatcher([key](const std::string& candidate) { return candidate == key; },
                      std::move(handler));
}

CacheService::Unsubscribe CacheService::watch(const std::regex& pattern, EventHandler handler) {
    return addWatcher([pattern](const std::string& candidate) {
        return std::regex_search(candidate, pattern);
    }, std::move(handler));
}

void CacheService::waitForPendingPublishes() {
    if (publisher_) {
        publisher_->waitForCompletion();
    }
}

size_t CacheService::watcherCount() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->watchers.size();
}

CacheService::Unsubscribe CacheService::addWatcher(std::function<bool(const std::string&)> matches,
                                                   EventHandler handler) {
    if (!handler) {
        throw ValidationError("Watch handler must be callable", "handler", "non-empty",
                              kComponentName);
    }

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->nextId++;
        registry_->watchers.push_back(Watcher{id, std::move(matches), std::move(handler)});
    }

    std::weak_ptr<WatcherRegistry> weak = registry_;
    return [weak, id]() {
        auto registry = weak.lock();
        if (!registry) {
            return;
        }
        std::lock_guard<std::mutex> lock(registry->mutex);
        auto& watchers = registry->watchers;
        watchers.erase(std::remove_if(watchers.begin(), watchers.end(),
                                      [id](const Watcher& w) { return w.id == id; }),
                       watchers.end());
    };
}

CacheChangeEvent CacheService::makeEvent(ChangeType type, const std::string& key,
                                         std::optional<std::string> value,
                                         const std::string& timestamp) {
    CacheChangeEvent event;
    event.type = type;
    event.key = key;
    event.value = std::move(value);
    event.timestamp = timestamp;
    if (!config_.originId.empty()) {
        event.originId = config_.originId;
    }
    event.sequence = ++sequence_;
    return event;
}

void CacheService::emit(const CacheChangeEvent& event) {
    if (!pubsub_) {
        dispatchLocal(event);
        return;
    }

    // Номер уже выдан: событие должно попасть в очередь публикации, иначе она остановится
    try {
        dispatchLocal(event);
    } catch (...) {
        publishInOrder(event);
        throw;
    }
    publishInOrder(event);
}

void CacheService::dispatchLocal(const CacheChangeEvent& event) {
    std::vector<Watcher> snapshot;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        snapshot = registry_->watchers;
    }

    for (const auto& watcher : snapshot) {
        try {
            if (watcher.matches(event.key)) {
                watcher.handler(event);
            }
        } catch (const std::exception& e) {
            logging::getLogger(kLoggerName)->error("Watcher failed on {} '{}': {}",
                                                   toString(event.type), event.key, e.what());
        }
    }
}

void CacheService::publishInOrder(const CacheChangeEvent& event) {
    std::lock_guard<std::mutex> lock(publishOrderMutex_);
    staged_.emplace(event.sequence.value_or(nextToPublish_), event);

    // Писатели из разных потоков приходят сюда в произвольном порядке
    while (!staged_.empty() && staged_.begin()->first == nextToPublish_) {
        enqueuePublish(staged_.begin()->second);
        staged_.erase(staged_.begin());
        ++nextToPublish_;
    }
}

void CacheService::enqueuePublish(const CacheChangeEvent& event) {
    auto pubsub = pubsub_;
    const std::string pattern = config_.channelPattern;

    try {
        publisher_->enqueue([pubsub, pattern, event]() {
            try {
                pubsub->publish(pattern, event);
            } catch (const std::exception& e) {
                logging::getLogger(kLoggerName)->error("Publish of {} '{}' (seq {}) failed: {}",
                                                       toString(event.type), event.key,
                                                       event.sequence.value_or(0), e.what());
            }
        });
    } catch (const std::runtime_error& e) {
        logging::getLogger(kLoggerName)->warn("Dropping publish of {} '{}': {}",
                                              toString(event.type), event.key, e.what());
    }
}

void CacheService::onRemoteEvent(const CacheChangeEvent& event) {
    if (event.originId && *event.originId == config_.originId) {
        return;
    }

    logging::getLogger(kLoggerName)->debug("Remote {} '{}' from {}", toString(event.type),
                                           event.key, event.originId.value_or("unknown"));
    dispatchLocal(event);
}

void CacheService::onAdapterEviction(const std::string& key, EvictionReason reason) {
    CacheChangeEvent event = makeEvent(ChangeType::Eviction, key, std::nullopt, currentTimestamp());
    event.reason = reason;
    emit(event);
}

} // namespace cache
} // namespace flycache
