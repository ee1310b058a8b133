#include "flycache/cache/redis/RedisPubSub.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/logging/Logging.hpp"

namespace flycache {
namespace cache {

namespace {

const char* kLoggerName = "redispubsub";
const char* kAdapterName = "RedisPubSub";
constexpr std::chrono::milliseconds kPollInterval{100};

} // namespace

RedisPubSub::RedisPubSub(const RedisAdapterConfig& config, std::string originId)
    : originId_(std::move(originId))
    , publisher_(std::make_unique<RedisConnection>(config, "publisher"))
    , registry_(std::make_shared<Registry>()) {
    registry_->subscriber = std::make_unique<RedisConnection>(config, "subscriber");
}

RedisPubSub::~RedisPubSub() {
    disconnect();
}

void RedisPubSub::connect() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (closed_) {
        const auto& config = publisher_->config();
        throw ConnectionError("Redis pub/sub is closed", config.host, config.port,
                              "disconnect() was called", kAdapterName);
    }

    publisher_->connect();
    registry_->subscriber->connect();
    resubscribeAll();

    if (!running_.exchange(true)) {
        reader_ = std::thread([this] { readerLoop(); });
    }

    logging::getLogger(kLoggerName)->info("Redis pub/sub connected (origin '{}')", originId_);
}

void RedisPubSub::disconnect() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (closed_.exchange(true)) {
        return;
    }

    running_ = false;
    {
        std::lock_guard<std::mutex> registryLock(registry_->mutex);
        for (const auto& entry : registry_->handlers) {
            registry_->subscriber->trySend({"PUNSUBSCRIBE", entry.first});
        }
        registry_->handlers.clear();
    }

    // Закрытие подписчика прерывает ожидание переподключения в потоке чтения
    registry_->subscriber->disconnect();
    if (reader_.joinable()) {
        reader_.join();
    }
    publisher_->disconnect();

    logging::getLogger(kLoggerName)->info("Redis pub/sub disconnected");
}

void RedisPubSub::publish(const std::string& pattern, const CacheChangeEvent& event) {
    const std::string channel = channelForPattern(pattern, kAdapterName);
    const std::string payload = event.toJson().dump();

    const RedisReply reply = publisher_->command({"PUBLISH", channel, payload}, "publish", event.key);
    logging::getLogger(kLoggerName)->debug("Published {} '{}' on {} to {} receivers",
                                           toString(event.type), event.key, channel, reply.integer);
}

PubSub::Unsubscribe RedisPubSub::subscribe(const std::string& pattern, EventHandler handler) {
    if (pattern.empty()) {
        throw ValidationError("Subscription pattern must not be empty", "pattern", "non-empty",
                              kAdapterName);
    }
    if (!handler) {
        throw ValidationError("Subscription handler must be callable", "handler", "non-empty",
                              kAdapterName);
    }
    if (closed_) {
        const auto& config = publisher_->config();
        throw ConnectionError("Redis pub/sub is closed", config.host, config.port,
                              "disconnect() was called", kAdapterName);
    }

    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        id = registry_->nextId++;
        auto& list = registry_->handlers[pattern];
        if (list.empty()) {
            // До connect() шаблон только запоминается и подписывается при подключении
            if (registry_->subscriber->trySend({"PSUBSCRIBE", pattern})) {
                logging::getLogger(kLoggerName)->debug("PSUBSCRIBE {}", pattern);
            }
        }
        list.emplace_back(id, std::move(handler));
    }

    std::weak_ptr<Registry> weak = registry_;
    auto done = std::make_shared<std::atomic<bool>>(false);
    return [weak, pattern, id, done]() {
        if (done->exchange(true)) {
            return;
        }
        if (auto registry = weak.lock()) {
            removeHandler(registry, pattern, id);
        }
    };
}

std::vector<std::string> RedisPubSub::activePatterns() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    std::vector<std::string> patterns;
    for (const auto& entry : registry_->handlers) {
        patterns.push_back(entry.first);
    }
    return patterns;
}

void RedisPubSub::removeHandler(const std::shared_ptr<Registry>& registry,
                                const std::string& pattern, uint64_t id) {
    std::lock_guard<std::mutex> lock(registry->mutex);
    auto it = registry->handlers.find(pattern);
    if (it == registry->handlers.end()) {
        return;
    }

    auto& list = it->second;
    for (auto handlerIt = list.begin(); handlerIt != list.end(); ++handlerIt) {
        if (handlerIt->first == id) {
            list.erase(handlerIt);
            break;
        }
    }

    if (list.empty()) {
        registry->handlers.erase(it);
        if (registry->subscriber->trySend({"PUNSUBSCRIBE", pattern})) {
            logging::getLogger(kLoggerName)->debug("PUNSUBSCRIBE {}", pattern);
        }
    }
}

void RedisPubSub::readerLoop() {
    auto logger = logging::getLogger(kLoggerName);
    auto& subscriber = *registry_->subscriber;

    while (running_) {
        try {
            auto reply = subscriber.readPushed(kPollInterval);
            if (reply) {
                handlePush(*reply);
            }
        } catch (const ConnectionError& e) {
            if (!running_) {
                break;
            }
            logger->warn("Subscriber connection lost: {}; reconnecting", e.reason());
            try {
                subscriber.reconnect();
                resubscribeAll();
            } catch (const ConnectionError& retryError) {
                if (running_) {
                    logger->error("Subscriber reconnect abandoned: {}", retryError.what());
                }
                break;
            }
        } catch (const std::exception& e) {
            logger->error("Subscriber reader error: {}", e.what());
        }
    }

    logger->debug("Subscriber reader stopped");
}

void RedisPubSub::handlePush(const RedisReply& reply) {
    if (reply.type != RedisReply::Type::Array || reply.elements.empty()) {
        return;
    }

    const std::string& kind = reply.elements[0].str;
    if (kind == "pmessage" && reply.elements.size() >= 4) {
        deliver(reply.elements[1].str, reply.elements[3].str);
    } else if (kind == "psubscribe" || kind == "punsubscribe") {
        logging::getLogger(kLoggerName)->debug("{} confirmed: {}", kind,
                                               reply.elements.size() > 1 ? reply.elements[1].str : "");
    }
}

void RedisPubSub::deliver(const std::string& pattern, const std::string& payload) {
    auto logger = logging::getLogger(kLoggerName);

    CacheChangeEvent event;
    try {
        event = CacheChangeEvent::fromJson(nlohmann::json::parse(payload));
    } catch (const nlohmann::json::exception& e) {
        logger->error("Dropping undecodable message on {}: {}", pattern, e.what());
        return;
    } catch (const ValidationError& e) {
        logger->error("Dropping invalid event on {}: {}", pattern, e.what());
        return;
    }

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto it = registry_->handlers.find(pattern);
        if (it == registry_->handlers.end()) {
            return;
        }
        for (const auto& entry : it->second) {
            handlers.push_back(entry.second);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            logger->error("Subscriber handler for {} failed on key '{}': {}",
                          pattern, event.key, e.what());
        }
    }
}

void RedisPubSub::resubscribeAll() {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    for (const auto& entry : registry_->handlers) {
        if (!registry_->subscriber->trySend({"PSUBSCRIBE", entry.first})) {
            logging::getLogger(kLoggerName)->warn("Could not resubscribe {}", entry.first);
        }
    }
    if (!registry_->handlers.empty()) {
        logging::getLogger(kLoggerName)->info("Resubscribed {} patterns",
                                              registry_->handlers.size());
    }
}

} // namespace cache
} // namespace flycache
