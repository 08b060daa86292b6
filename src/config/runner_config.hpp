/*
 * runner_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: Script runner configuration

**************************************************/

#ifndef SCRIPTDECK_CONFIG_RUNNER_CONFIG_HPP
#define SCRIPTDECK_CONFIG_RUNNER_CONFIG_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace scriptdeck::config {

using json = nlohmann::json;

/**
 * @brief Convert a level name to an spdlog level
 *
 * Accepts trace, debug, info, warn, error, critical and off, plus the
 * aliases warning, err, fatal and none. Anything else maps to info.
 */
[[nodiscard]] inline spdlog::level::level_enum logLevelFromString(
    const std::string& str) {
    if (str == "trace") return spdlog::level::trace;
    if (str == "debug") return spdlog::level::debug;
    if (str == "info") return spdlog::level::info;
    if (str == "warn" || str == "warning") return spdlog::level::warn;
    if (str == "error" || str == "err") return spdlog::level::err;
    if (str == "critical" || str == "fatal") return spdlog::level::critical;
    if (str == "off" || str == "none") return spdlog::level::off;
    return spdlog::level::info;
}

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
    std::string level{"info"};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"};
    bool enableConsole{true};
    bool enableFile{false};
    std::string filePath{"logs/scriptdeck.log"};
    size_t maxFileSize{10 * 1024 * 1024};  ///< Bytes before rotation
    size_t maxFiles{5};                    ///< Rotated files kept

    [[nodiscard]] json toJson() const {
        return {{"level", level},
                {"pattern", pattern},
                {"enableConsole", enableConsole},
                {"enableFile", enableFile},
                {"filePath", filePath},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig fromJson(const json& j) {
        LoggingConfig cfg;
        cfg.level = j.value("level", cfg.level);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.enableConsole = j.value("enableConsole", cfg.enableConsole);
        cfg.enableFile = j.value("enableFile", cfg.enableFile);
        cfg.filePath = j.value("filePath", cfg.filePath);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
        return cfg;
    }
};

/**
 * @brief Top-level runner configuration
 *
 * @example
 * ```json
 * {
 *   "storeDirectory": "/home/me/.local/share/scriptdeck/scripts",
 *   "workingDirectory": "",
 *   "killProcessGroup": true,
 *   "readBufferSize": 4096,
 *   "logging": { "level": "debug" }
 * }
 * ```
 */
struct RunnerConfig {
    std::string storeDirectory;    ///< Empty = defaultStoreDirectory()
    std::string workingDirectory;  ///< Empty = user's home
    bool killProcessGroup{true};
    size_t readBufferSize{4096};
    std::vector<std::string> gitBashCandidates;  ///< Empty = built-in list
    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static RunnerConfig fromJson(const json& j);

    /**
     * @brief storeDirectory, or the platform default when unset
     */
    [[nodiscard]] auto effectiveStoreDirectory() const
        -> std::filesystem::path;
};

/**
 * @brief Per-user script directory
 *
 * `$XDG_DATA_HOME/scriptdeck/scripts`, else
 * `~/.local/share/scriptdeck/scripts`; `%APPDATA%\scriptdeck\scripts`
 * on Windows.
 */
[[nodiscard]] auto defaultStoreDirectory() -> std::filesystem::path;

/**
 * @brief Default configuration file location
 */
[[nodiscard]] auto defaultConfigPath() -> std::filesystem::path;

/**
 * @brief Read a configuration file
 * @return Defaults when the file does not exist, an error for malformed JSON
 */
[[nodiscard]] auto loadRunnerConfig(const std::filesystem::path& path)
    -> std::expected<RunnerConfig, std::string>;

[[nodiscard]] auto saveRunnerConfig(const RunnerConfig& config,
                                    const std::filesystem::path& path)
    -> std::expected<void, std::string>;

}  // namespace scriptdeck::config

#endif  // SCRIPTDECK_CONFIG_RUNNER_CONFIG_HPP
