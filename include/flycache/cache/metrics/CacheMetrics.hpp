#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace flycache {
namespace cache {

struct CacheStats {
    uint64_t hits = 0;              // Количество попаданий
    uint64_t misses = 0;            // Количество промахов
    uint64_t evictions = 0;         // Количество вытеснений
    uint64_t memoryUsage = 0;       // Использование памяти (байт, приблизительно)
    uint64_t entryCount = 0;        // Количество записей
    uint64_t uptime = 0;            // Время работы адаптера (мс)

    double hitRate() const {
        const uint64_t lookups = hits + misses;
        if (lookups == 0) return 0.0;
        return static_cast<double>(hits) / static_cast<double>(lookups);
    }

    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"evictions", evictions},
            {"memoryUsage", memoryUsage},
            {"entryCount", entryCount},
            {"uptime", uptime},
            {"hitRate", hitRate()}
        };
    }
};

// Результат проверки состояния адаптера
struct HealthStatus {
    bool healthy = false;
    std::string message;
    nlohmann::json details = nlohmann::json::object();

    nlohmann::json toJson() const {
        return {
            {"healthy", healthy},
            {"message", message},
            {"details", details}
        };
    }
};

} // namespace cache
} // namespace flycache
