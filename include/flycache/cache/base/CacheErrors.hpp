#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace flycache {
namespace cache {

/**
 * @brief Базовый класс всех ошибок слоя кэша.
 *
 * `adapter()` называет компонент-источник ("MemoryAdapter", "RedisAdapter",
 * "RedisPubSub" или "CacheService").
 */
class CacheError : public std::runtime_error {
public:
    CacheError(const std::string& message, std::string adapter);

    const std::string& adapter() const noexcept { return adapter_; }

private:
    std::string adapter_;
};

/**
 * @brief Входные данные вызывающего нарушают контракт.
 *
 * Выбрасывается синхронно до любого ввода-вывода и не повторяется.
 */
class ValidationError : public CacheError {
public:
    ValidationError(const std::string& message, std::string field, std::string constraint,
                    std::string adapter = {});

    const std::string& field() const noexcept { return field_; }
    const std::string& constraint() const noexcept { return constraint_; }

private:
    std::string field_;
    std::string constraint_;
};

/**
 * @brief Соединение с сервером не удалось установить или сохранить.
 */
class ConnectionError : public CacheError {
public:
    ConnectionError(const std::string& message, std::string host, int port, std::string reason,
                    std::string adapter = {});

    const std::string& host() const noexcept { return host_; }
    int port() const noexcept { return port_; }
    const std::string& reason() const noexcept { return reason_; }

private:
    std::string host_;
    int port_;
    std::string reason_;
};

/**
 * @brief Сбой отдельной команды на рабочем соединении.
 */
class OperationError : public CacheError {
public:
    OperationError(const std::string& message, std::string method, std::string key,
                   std::optional<double> ttl, std::string originalError,
                   std::string adapter = {});

    const std::string& method() const noexcept { return method_; }
    const std::string& key() const noexcept { return key_; }
    const std::optional<double>& ttl() const noexcept { return ttl_; }
    const std::string& originalError() const noexcept { return originalError_; }

private:
    std::string method_;
    std::string key_;
    std::optional<double> ttl_;
    std::string originalError_;
};

// Проверка ключа: не пустой и не состоит только из пробелов
void validateKey(const std::string& key, const std::string& adapter);

// Проверка TTL: конечное число >= 0
void validateTtl(const std::optional<double>& ttlSeconds, const std::string& adapter);

// Верхняя граница TTL с реальным сроком жизни (100 лет); больший TTL означает бессрочную запись
constexpr double kMaxExpiringTtlSeconds = 100.0 * 365.0 * 24.0 * 3600.0;

// true для 0 < ttl <= kMaxExpiringTtlSeconds
bool expiresAfter(const std::optional<double>& ttlSeconds);

} // namespace cache
} // namespace flycache
