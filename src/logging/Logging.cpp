#include "flycache/logging/Logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flycache {
namespace logging {

namespace {

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::string& componentLogDirectory() {
    static std::string directory = "logs";
    return directory;
}

} // namespace

LoggingConfig LoggingConfig::fromJson(const nlohmann::json& j) {
    LoggingConfig config;
    config.logDirectory = j.value("logDirectory", config.logDirectory);
    config.defaultLoggerName = j.value("defaultLoggerName", config.defaultLoggerName);
    if (j.contains("consoleLevel")) {
        config.consoleLevel = spdlog::level::from_str(j.at("consoleLevel").get<std::string>());
    }
    if (j.contains("fileLevel")) {
        config.fileLevel = spdlog::level::from_str(j.at("fileLevel").get<std::string>());
    }
    config.maxFileSize = j.value("maxFileSize", config.maxFileSize);
    config.maxFiles = j.value("maxFiles", config.maxFiles);
    return config;
}

void initializeLogging(const LoggingConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid logging configuration");
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    try {
        std::filesystem::create_directories(config.logDirectory);
        componentLogDirectory() = config.logDirectory;

        // Вывод в консоль
        auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        consoleSink->set_level(config.consoleLevel);
        consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        // Вывод в файл
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.logDirectory + "/" + config.defaultLoggerName + ".log",
            config.maxFileSize, config.maxFiles);
        fileSink->set_level(config.fileLevel);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

        auto logger = std::make_shared<spdlog::logger>(config.defaultLoggerName,
            spdlog::sinks_init_list{consoleSink, fileSink});

        spdlog::set_default_logger(logger);
        spdlog::set_level(std::min(config.consoleLevel, config.fileLevel));

        spdlog::info("Logging system initialized in '{}'", config.logDirectory);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

std::shared_ptr<spdlog::logger> getLogger(const std::string& name) {
    if (auto logger = spdlog::get(name)) {
        return logger;
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    try {
        logger = spdlog::rotating_logger_mt(name, componentLogDirectory() + "/" + name + ".log",
                                            1024 * 1024 * 5, 3);
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "Cannot open log file for '" << name << "': " << e.what() << std::endl;
        logger = spdlog::stderr_color_mt(name);
    }
    logger->set_level(spdlog::level::debug);
    return logger;
}

} // namespace logging
} // namespace flycache
