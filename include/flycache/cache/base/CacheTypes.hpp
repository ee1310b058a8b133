#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

// Тип изменения кэша
enum class ChangeType {
    Set,
    Delete,
    Eviction
};

// Причина вытеснения записи
enum class EvictionReason {
    Lru,
    Ttl
};

const char* toString(ChangeType type);
const char* toString(EvictionReason reason);

/// Разбор "set" / "delete" / "eviction"; std::nullopt для остального.
std::optional<ChangeType> changeTypeFromString(const std::string& text);
std::optional<EvictionReason> evictionReasonFromString(const std::string& text);

/**
 * @brief Метка времени ISO-8601 UTC с миллисекундами, например 2026-10-17T08:30:00.125Z
 */
std::string formatTimestamp(std::chrono::system_clock::time_point time);
std::string currentTimestamp();

/**
 * @brief Одна запись для пакетной записи mset: ключ, значение, необязательный TTL (секунды).
 */
struct BatchEntry {
    std::string key;
    std::string value;
    std::optional<double> ttlSeconds;
};

/**
 * @brief Неизменяемое уведомление об одном изменении кэша.
 *
 * `value` есть только у событий Set, `reason` только у Eviction.
 * `originId` и `sequence` задают процесс-источник и локальный порядок.
 */
struct CacheChangeEvent {
    ChangeType type = ChangeType::Set;
    std::string key;
    std::optional<std::string> value;
    std::string timestamp;
    std::optional<std::string> originId;
    std::optional<uint64_t> sequence;
    std::optional<EvictionReason> reason;

    nlohmann::json toJson() const;

    /**
     * @brief Событие из JSON-представления канала.
     * @throws ValidationError если `type` или `key` отсутствует либо некорректен
     */
    static CacheChangeEvent fromJson(const nlohmann::json& j);
};

} // namespace cache
} // namespace flycache
