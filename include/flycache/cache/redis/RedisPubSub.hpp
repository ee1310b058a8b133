#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "flycache/cache/base/PubSub.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"
#include "flycache/cache/redis/RedisConnection.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Транспорт событий кэша через Redis PUBLISH/PSUBSCRIBE.
 *
 * Использует два соединения: соединение подписчика находится в режиме
 * подписки и не выполняет других команд. Поток чтения опрашивает его сокет,
 * декодирует каждое pmessage и передает обработчикам шаблона. После
 * переподключения подписчика все активные шаблоны подписываются заново.
 */
class RedisPubSub : public PubSub {
public:
    explicit RedisPubSub(const RedisAdapterConfig& config, std::string originId = {});
    ~RedisPubSub() override;

    RedisPubSub(const RedisPubSub&) = delete;
    RedisPubSub& operator=(const RedisPubSub&) = delete;

    /// @throws ConnectionError если не удалось установить одно из соединений
    void connect() override;
    void disconnect() override;

    /**
     * @throws ValidationError для шаблона без канала публикации
     * @throws OperationError / ConnectionError при сбое PUBLISH
     */
    void publish(const std::string& pattern, const CacheChangeEvent& event) override;
    Unsubscribe subscribe(const std::string& pattern, EventHandler handler) override;

    // Шаблоны, на которые сейчас есть подписчики
    std::vector<std::string> activePatterns() const;
    const std::string& originId() const { return originId_; }

private:
    struct Registry {
        std::mutex mutex;
        std::map<std::string, std::vector<std::pair<uint64_t, EventHandler>>> handlers;
        uint64_t nextId = 1;
        std::unique_ptr<RedisConnection> subscriber;
    };

    static void removeHandler(const std::shared_ptr<Registry>& registry,
                              const std::string& pattern, uint64_t id);
    void readerLoop();
    void handlePush(const RedisReply& reply);
    void deliver(const std::string& pattern, const std::string& payload);
    void resubscribeAll();

    std::string originId_;
    std::unique_ptr<RedisConnection> publisher_;
    std::shared_ptr<Registry> registry_;
    std::thread reader_;
    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> closed_{false};
};

} // namespace cache
} // namespace flycache
