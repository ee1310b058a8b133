#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"

struct redisContext;

namespace flycache {
namespace cache {

// Состояние соединения с сервером
enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

const char* toString(ConnectionState state);

/**
 * @brief Собственная копия ответа hiredis.
 */
struct RedisReply {
    enum class Type {
        Nil,
        String,
        Status,
        Integer,
        Array,
        Error
    };

    Type type = Type::Nil;
    std::string str;
    long long integer = 0;
    std::vector<RedisReply> elements;

    bool isNil() const { return type == Type::Nil; }
    bool isError() const { return type == Type::Error; }
};

/**
 * @brief Синхронное соединение hiredis с повторами и переподключением.
 *
 * Состояния: Disconnected -> Connecting -> Connected; ошибка транспорта
 * переводит Connected -> Reconnecting, и стратегия повторов выбирает между
 * Connected и Disconnected (ConnectionError). disconnect() окончателен и
 * идемпотентен.
 *
 * Команды сериализуются на контексте hiredis внутренним мьютексом. Вызов во
 * время переподключения ждет его завершения, если только enableOfflineQueue
 * не false: тогда он сразу завершается ошибкой.
 */
class RedisConnection {
public:
    RedisConnection(RedisAdapterConfig config, std::string role);
    ~RedisConnection();

    RedisConnection(const RedisConnection&) = delete;
    RedisConnection& operator=(const RedisConnection&) = delete;

    /**
     * @brief Открывает сокет, выполняет AUTH, SELECT и PING.
     * @throws ConnectionError если стратегия повторов исчерпана
     */
    void connect();
    void disconnect();

    /**
     * @brief Выполняет одну команду и возвращает ответ.
     *
     * Сбой транспорта вызывает переподключение, команда отправляется повторно
     * не более maxRetriesPerRequest раз.
     * @throws OperationError на ответ-ошибку сервера и исчерпанные повторы
     * @throws ConnectionError если соединение не удалось восстановить
     */
    RedisReply command(const std::vector<std::string>& args, const std::string& method,
                       const std::string& key = {}, std::optional<double> ttl = std::nullopt);

    /**
     * @brief Отправляет все команды до чтения первого ответа.
     *
     * Ответы-ошибки собираются и сообщаются после чтения всего пакета.
     */
    std::vector<RedisReply> pipeline(const std::vector<std::vector<std::string>>& commands,
                                     const std::string& method);

    // Режим подписки: отправка без чтения ответа; false, если соединения нет
    bool trySend(const std::vector<std::string>& args);

    /**
     * @brief Ждет не дольше `wait` одно входящее сообщение (режим подписки).
     * @throws ConnectionError при сбое сокета; состояние становится Reconnecting
     */
    std::optional<RedisReply> readPushed(std::chrono::milliseconds wait);

    // Переподключение по стратегии повторов (используется подписчиком)
    void reconnect();

    ConnectionState state() const { return state_.load(); }
    bool isClosed() const { return closed_.load(); }
    unsigned connectionAttempts() const { return attempts_.load(); }
    const RedisAdapterConfig& config() const { return config_; }
    const std::string& role() const { return role_; }

private:
    struct ContextDeleter {
        void operator()(redisContext* context) const;
    };
    using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

    ContextPtr openOnce();
    void connectWithRetryLocked(ConnectionState during);
    void ensureConnectedLocked();
    void dropContextLocked();
    void throwIfClosed() const;
    ConnectionError connectionError(const std::string& message, const std::string& reason) const;

    RedisAdapterConfig config_;
    RetryStrategy retryStrategy_;
    std::string role_;
    ContextPtr context_;
    std::mutex mutex_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
    std::atomic<bool> closed_{false};
    std::atomic<unsigned> attempts_{0};
    bool everConnected_ = false;
};

} // namespace cache
} // namespace flycache
