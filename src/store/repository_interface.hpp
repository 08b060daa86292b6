/*
 * repository_interface.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SCRIPTDECK_STORE_REPOSITORY_INTERFACE_HPP
#define SCRIPTDECK_STORE_REPOSITORY_INTERFACE_HPP

#include <optional>
#include <string>

#include "script_record.hpp"

namespace scriptdeck::store {

/**
 * @brief Read access to stored scripts, as needed by execution
 *
 * Implementations must be thread-safe. Execution never writes records.
 */
class IScriptRepository {
public:
    virtual ~IScriptRepository() = default;

    /**
     * @brief Look up a script by id
     * @return The record, or nullopt if it does not exist
     */
    [[nodiscard]] virtual auto get(const std::string& id)
        -> std::optional<ScriptRecord> = 0;
};

}  // namespace scriptdeck::store

#endif  // SCRIPTDECK_STORE_REPOSITORY_INTERFACE_HPP
