/*
 * memory_repository.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef SCRIPTDECK_STORE_MEMORY_REPOSITORY_HPP
#define SCRIPTDECK_STORE_MEMORY_REPOSITORY_HPP

#include <shared_mutex>
#include <unordered_map>

#include "repository_interface.hpp"

namespace scriptdeck::store {

/**
 * @brief In-memory script repository
 *
 * Volatile storage for tests and embedding hosts that keep their own
 * records. Thread-safe for concurrent readers and writers.
 */
class MemoryScriptRepository : public IScriptRepository {
public:
    MemoryScriptRepository() = default;
    ~MemoryScriptRepository() override = default;

    [[nodiscard]] auto get(const std::string& id)
        -> std::optional<ScriptRecord> override;

    /**
     * @brief Insert or replace a record by id
     */
    void put(ScriptRecord record);

    /**
     * @return true if a record was removed
     */
    bool remove(const std::string& id);

    [[nodiscard]] auto count() const -> size_t;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ScriptRecord> records_;
};

}  // namespace scriptdeck::store

#endif  // SCRIPTDECK_STORE_MEMORY_REPOSITORY_HPP
