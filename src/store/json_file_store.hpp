/*
 * json_file_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file json_file_store.hpp
 * @brief Script records stored as one JSON file each
 * @date 2024-1-13
 * @version 2.1.0
 */

#ifndef SCRIPTDECK_STORE_JSON_FILE_STORE_HPP
#define SCRIPTDECK_STORE_JSON_FILE_STORE_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "repository_interface.hpp"

namespace scriptdeck::store {

enum class StoreError {
    NameConflict,   ///< Rename onto another record's name
    IoFailure,      ///< Directory or file could not be written
    InvalidRecord   ///< Id unusable as a file name
};

[[nodiscard]] constexpr std::string_view storeErrorToString(
    StoreError error) noexcept {
    switch (error) {
        case StoreError::NameConflict: return "NAME_CONFLICT";
        case StoreError::IoFailure: return "IO_FAILURE";
        case StoreError::InvalidRecord: return "INVALID_RECORD";
    }
    return "SAVE_FAILED";
}

struct StoreFailure {
    StoreError code;
    std::string message;
};

/**
 * @brief Fields supplied by the editor when saving a script
 */
struct ScriptDraft {
    std::optional<std::string> id;  ///< Empty = create a new record
    std::string name;
    std::optional<exec::ShellKind> shell;
    std::string content;
};

/**
 * @brief Directory-backed script repository
 *
 * Each record lives in `<directory>/<id>.json`. Names are unique,
 * compared case-insensitively: a new record whose name is taken gets a
 * " (n)" suffix, while renaming an existing record onto a taken name is
 * rejected. Thread-safe within one process.
 */
class JsonFileScriptStore : public IScriptRepository {
public:
    explicit JsonFileScriptStore(
        std::filesystem::path directory,
        exec::Platform platform = exec::currentPlatform());

    [[nodiscard]] auto get(const std::string& id)
        -> std::optional<ScriptRecord> override;

    /**
     * @brief All readable records, most recently updated first
     */
    [[nodiscard]] auto list() const -> std::vector<ScriptSummary>;

    /**
     * @brief Create or update a record
     * @return The record as written, or the failure
     */
    [[nodiscard]] auto save(const ScriptDraft& draft)
        -> std::expected<ScriptRecord, StoreFailure>;

    /**
     * @return true if a record file was deleted
     */
    bool remove(const std::string& id);

    [[nodiscard]] auto directory() const -> const std::filesystem::path& {
        return directory_;
    }

    /**
     * @brief New record id: 8 random base-36 characters followed by the
     *        base-36 millisecond timestamp
     */
    [[nodiscard]] static auto generateId() -> std::string;

private:
    [[nodiscard]] auto listUnlocked() const -> std::vector<ScriptSummary>;
    [[nodiscard]] auto load(const std::string& id) const
        -> std::optional<ScriptRecord>;
    [[nodiscard]] auto recordPath(const std::string& id) const
        -> std::filesystem::path;
    [[nodiscard]] auto uniqueName(std::string desired, const std::string& id,
                                  const std::vector<ScriptSummary>& all) const
        -> std::string;

    std::filesystem::path directory_;
    exec::Platform platform_;
    mutable std::shared_mutex mutex_;
};

}  // namespace scriptdeck::store

#endif  // SCRIPTDECK_STORE_JSON_FILE_STORE_HPP
