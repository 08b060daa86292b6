/*
 * runner_config.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runner_config.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#include <spdlog/spdlog.h>

namespace scriptdeck::config {

namespace {

auto envValue(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
}

}  // namespace

json RunnerConfig::toJson() const {
    return {{"storeDirectory", storeDirectory},
            {"workingDirectory", workingDirectory},
            {"killProcessGroup", killProcessGroup},
            {"readBufferSize", readBufferSize},
            {"gitBashCandidates", gitBashCandidates},
            {"logging", logging.toJson()}};
}

RunnerConfig RunnerConfig::fromJson(const json& j) {
    RunnerConfig cfg;
    cfg.storeDirectory = j.value("storeDirectory", cfg.storeDirectory);
    cfg.workingDirectory = j.value("workingDirectory", cfg.workingDirectory);
    cfg.killProcessGroup = j.value("killProcessGroup", cfg.killProcessGroup);
    cfg.readBufferSize = j.value("readBufferSize", cfg.readBufferSize);
    if (cfg.readBufferSize == 0) {
        cfg.readBufferSize = 4096;
    }
    if (j.contains("gitBashCandidates") && j["gitBashCandidates"].is_array()) {
        cfg.gitBashCandidates =
            j["gitBashCandidates"].get<std::vector<std::string>>();
    }
    if (j.contains("logging") && j["logging"].is_object()) {
        cfg.logging = LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

auto RunnerConfig::effectiveStoreDirectory() const -> std::filesystem::path {
    if (!storeDirectory.empty()) {
        return storeDirectory;
    }
    return defaultStoreDirectory();
}

auto defaultStoreDirectory() -> std::filesystem::path {
    std::filesystem::path base;
#ifdef _WIN32
    base = envValue("APPDATA");
    if (base.empty()) {
        base = std::filesystem::path(envValue("USERPROFILE")) / "AppData" /
               "Roaming";
    }
#else
    base = envValue("XDG_DATA_HOME");
    if (base.empty()) {
        base = std::filesystem::path(envValue("HOME")) / ".local" / "share";
    }
#endif
    return base / "scriptdeck" / "scripts";
}

auto defaultConfigPath() -> std::filesystem::path {
    return defaultStoreDirectory().parent_path() / "scriptdeck.json";
}

auto loadRunnerConfig(const std::filesystem::path& path)
    -> std::expected<RunnerConfig, std::string> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("No configuration at {}, using defaults",
                      path.string());
        return RunnerConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected("Cannot open " + path.string());
    }
    try {
        auto j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(path.string() + ": expected a JSON object");
        }
        return RunnerConfig::fromJson(j);
    } catch (const json::exception& e) {
        return std::unexpected(path.string() + ": " + e.what());
    }
}

auto saveRunnerConfig(const RunnerConfig& config,
                      const std::filesystem::path& path)
    -> std::expected<void, std::string> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected("Cannot create " +
                                   path.parent_path().string() + ": " +
                                   ec.message());
        }
    }
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return std::unexpected("Cannot write " + path.string());
    }
    file << config.toJson().dump(2) << '\n';
    if (!file.flush()) {
        return std::unexpected("Cannot write " + path.string());
    }
    return {};
}

}  // namespace scriptdeck::config
