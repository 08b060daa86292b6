/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_setup.hpp"

#include <filesystem>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace scriptdeck::logging {

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    try {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_level(level);
        if (!pattern.empty()) {
            sink->set_pattern(pattern);
        }
        return sink;
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to create console sink: {}", e.what());
        return nullptr;
    }
}

auto SinkFactory::createRotatingFileSink(const std::string& filePath,
                                         size_t maxSize, size_t maxFiles,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    try {
        ensureDirectoryExists(filePath);
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filePath, maxSize, maxFiles);
        sink->set_level(level);
        if (!pattern.empty()) {
            sink->set_pattern(pattern);
        }
        return sink;
    } catch (const std::exception& e) {
        spdlog::error("Failed to create file sink '{}': {}", filePath,
                      e.what());
        return nullptr;
    }
}

void SinkFactory::ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger> {
    auto level = config::logLevelFromString(config.level);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enableConsole) {
        if (auto sink = SinkFactory::createConsoleSink(level, config.pattern)) {
            sinks.push_back(std::move(sink));
        }
    }
    if (config.enableFile) {
        if (auto sink = SinkFactory::createRotatingFileSink(
                config.filePath, config.maxFileSize, config.maxFiles, level,
                config.pattern)) {
            sinks.push_back(std::move(sink));
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(),
                                                   sinks.end());
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(kLoggerName);
    spdlog::set_default_logger(logger);
    return logger;
}

}  // namespace scriptdeck::logging
