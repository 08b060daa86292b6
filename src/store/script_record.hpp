/*
 * script_record.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file script_record.hpp
 * @brief Persisted script record
 * @date 2024-1-13
 */

#ifndef SCRIPTDECK_STORE_SCRIPT_RECORD_HPP
#define SCRIPTDECK_STORE_SCRIPT_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../exec/types.hpp"

namespace scriptdeck::store {

/**
 * @brief A named script as stored by the persistence layer
 */
struct ScriptRecord {
    std::string id;
    std::string name;
    std::optional<exec::ShellKind> shell;  ///< Empty = platform default
    std::string content;
    int64_t createdAt{0};  ///< Epoch milliseconds
    int64_t updatedAt{0};  ///< Epoch milliseconds

    [[nodiscard]] auto shellOrDefault(
        exec::Platform platform = exec::currentPlatform()) const
        -> exec::ShellKind {
        return shell.value_or(exec::defaultShellKind(platform));
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @brief Parse a stored record
     * @return Record, or nullopt when id or name is missing
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j)
        -> std::optional<ScriptRecord>;
};

/**
 * @brief Listing entry, without content
 */
struct ScriptSummary {
    std::string id;
    std::string name;
    std::optional<exec::ShellKind> shell;
    int64_t updatedAt{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Current time in epoch milliseconds
 */
[[nodiscard]] auto nowMillis() -> int64_t;

}  // namespace scriptdeck::store

#endif  // SCRIPTDECK_STORE_SCRIPT_RECORD_HPP
