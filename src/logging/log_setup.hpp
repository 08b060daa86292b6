/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SCRIPTDECK_LOGGING_LOG_SETUP_HPP
#define SCRIPTDECK_LOGGING_LOG_SETUP_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "../config/runner_config.hpp"

namespace scriptdeck::logging {

inline constexpr const char* kLoggerName = "scriptdeck";

/**
 * @brief Sink construction helpers
 *
 * Each factory returns nullptr instead of throwing when the sink cannot
 * be created.
 */
class SinkFactory {
public:
    [[nodiscard]] static auto createConsoleSink(
        spdlog::level::level_enum level, const std::string& pattern)
        -> spdlog::sink_ptr;

    [[nodiscard]] static auto createRotatingFileSink(
        const std::string& filePath, size_t maxSize, size_t maxFiles,
        spdlog::level::level_enum level, const std::string& pattern)
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& filePath);
};

/**
 * @brief Install the "scriptdeck" logger as spdlog's default
 *
 * Never throws; sinks that fail to open are reported and skipped.
 * @return The installed logger
 */
auto setupLogging(const config::LoggingConfig& config)
    -> std::shared_ptr<spdlog::logger>;

}  // namespace scriptdeck::logging

#endif  // SCRIPTDECK_LOGGING_LOG_SETUP_HPP
