#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace flycache {
namespace logging {

// Конфигурация системы логирования
struct LoggingConfig {
    std::string logDirectory = "logs";
    std::string defaultLoggerName = "flycache";
    spdlog::level::level_enum consoleLevel = spdlog::level::info;
    spdlog::level::level_enum fileLevel = spdlog::level::debug;
    size_t maxFileSize = 1024 * 1024 * 10;
    size_t maxFiles = 5;

    bool validate() const {
        return !defaultLoggerName.empty() && maxFileSize > 0 && maxFiles > 0;
    }

    static LoggingConfig fromJson(const nlohmann::json& j);
};

/**
 * @brief Устанавливает логгер по умолчанию с выводом в консоль и ротируемый файл.
 * @throws std::invalid_argument если конфигурация некорректна
 */
void initializeLogging(const LoggingConfig& config = LoggingConfig{});

/**
 * @brief Логгер компонента по имени, создается при первом обращении.
 *
 * Новый логгер пишет в ротируемый файл `<logDirectory>/<name>.log`; если файл
 * не открывается, используется stderr.
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

} // namespace logging
} // namespace flycache
