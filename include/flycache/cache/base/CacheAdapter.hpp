#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/metrics/CacheMetrics.hpp"

namespace flycache {
namespace cache {

/**
 * @brief Единый интерфейс хранилища для всех адаптеров кэша.
 *
 * Каждая операция атомарна в пределах одного ключа. Пакетные операции
 * (mget/mset) не атомарны между ключами: после исключения состояние каждого
 * ключа пакета неизвестно и должно быть перечитано.
 */
class CacheAdapter {
public:
    using EvictionCallback = std::function<void(const std::string& key, EvictionReason reason)>;

    virtual ~CacheAdapter() = default;

    /// Значение по ключу или std::nullopt.
    virtual std::optional<std::string> get(const std::string& key) = 0;
    /// Сохранить значение; ttlSeconds отсутствует = TTL адаптера по умолчанию.
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<double> ttlSeconds = std::nullopt) = 0;
    /// Удалить ключ. Возвращает true, если ключ существовал.
    virtual bool del(const std::string& key) = 0;
    virtual std::vector<std::optional<std::string>> mget(const std::vector<std::string>& keys) = 0;
    virtual void mset(const std::vector<BatchEntry>& entries) = 0;
    /// Ключи, подходящие под glob-шаблон (отсутствует = все ключи).
    virtual std::vector<std::string> keys(const std::optional<std::string>& pattern = std::nullopt) = 0;
    /// Удалить ключи по шаблону. Возвращает количество удаленных.
    virtual size_t clear(const std::optional<std::string>& pattern = std::nullopt) = 0;
    virtual CacheStats getStats() = 0;

    // Необязательный жизненный цикл
    virtual void connect() {}
    virtual void disconnect() {}
    virtual HealthStatus healthCheck() {
        HealthStatus status;
        status.healthy = true;
        status.message = "Adapter does not implement healthCheck";
        return status;
    }

    /**
     * @brief Регистрирует получателя уведомлений о записях, удаленных самим адаптером.
     *
     * Адаптеры без локально наблюдаемых вытеснений его игнорируют.
     */
    virtual void setEvictionCallback(EvictionCallback callback) { (void)callback; }

    /// Имя адаптера для логов и ошибок.
    virtual std::string name() const = 0;
};

} // namespace cache
} // namespace flycache
