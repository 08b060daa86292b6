/*
 * json_file_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file json_file_store.cpp
 * @brief Script records stored as one JSON file each
 * @date 2024-1-13
 */

#include "json_file_store.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <random>
#include <regex>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace scriptdeck::store {

namespace {

constexpr std::string_view kExtension = ".json";
constexpr std::string_view kBase36 = "0123456789abcdefghijklmnopqrstuvwxyz";

auto toLower(std::string_view text) -> std::string {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lowered;
}

auto trim(std::string_view text) -> std::string {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

// Ids become file names
bool isValidId(std::string_view id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}

auto toBase36(uint64_t value) -> std::string {
    if (value == 0) {
        return "0";
    }
    std::string digits;
    while (value > 0) {
        digits += kBase36[value % 36];
        value /= 36;
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

}  // namespace

JsonFileScriptStore::JsonFileScriptStore(std::filesystem::path directory,
                                         exec::Platform platform)
    : directory_(std::move(directory)), platform_(platform) {}

auto JsonFileScriptStore::generateId() -> std::string {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<size_t> pick(0, kBase36.size() - 1);

    std::string id;
    for (int i = 0; i < 8; ++i) {
        id += kBase36[pick(rng)];
    }
    id += toBase36(static_cast<uint64_t>(nowMillis()));
    return id;
}

auto JsonFileScriptStore::recordPath(const std::string& id) const
    -> std::filesystem::path {
    return directory_ / (id + std::string(kExtension));
}

auto JsonFileScriptStore::load(const std::string& id) const
    -> std::optional<ScriptRecord> {
    if (!isValidId(id)) {
        return std::nullopt;
    }
    auto path = recordPath(id);
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }

    try {
        auto j = nlohmann::json::parse(file);
        auto record = ScriptRecord::fromJson(j);
        if (!record) {
            spdlog::warn("JsonFileScriptStore: {} is not a script record",
                         path.string());
        }
        return record;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("JsonFileScriptStore: failed to read {}: {}",
                     path.string(), e.what());
        return std::nullopt;
    }
}

auto JsonFileScriptStore::get(const std::string& id)
    -> std::optional<ScriptRecord> {
    std::shared_lock lock(mutex_);
    return load(id);
}

auto JsonFileScriptStore::list() const -> std::vector<ScriptSummary> {
    std::shared_lock lock(mutex_);
    return listUnlocked();
}

auto JsonFileScriptStore::listUnlocked() const -> std::vector<ScriptSummary> {
    std::vector<ScriptSummary> summaries;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return summaries;
    }

    for (const auto& entry :
         std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() ||
            entry.path().extension() != kExtension) {
            continue;
        }
        auto record = load(entry.path().stem().string());
        if (!record) {
            continue;
        }
        summaries.push_back(ScriptSummary{record->id, record->name,
                                          record->shell, record->updatedAt});
    }
    if (ec) {
        spdlog::warn("JsonFileScriptStore: cannot list {}: {}",
                     directory_.string(), ec.message());
    }

    std::stable_sort(summaries.begin(), summaries.end(),
                     [](const ScriptSummary& a, const ScriptSummary& b) {
                         return a.updatedAt > b.updatedAt;
                     });
    return summaries;
}

auto JsonFileScriptStore::uniqueName(std::string desired,
                                     const std::string& id,
                                     const std::vector<ScriptSummary>& all)
    const -> std::string {
    auto taken = [&](const std::string& name) {
        auto lowered = toLower(name);
        return std::any_of(all.begin(), all.end(),
                           [&](const ScriptSummary& s) {
                               return s.id != id && toLower(s.name) == lowered;
                           });
    };

    if (!taken(desired)) {
        return desired;
    }

    static const std::regex suffix(R"( \(\d+\)$)");
    auto base = std::regex_replace(desired, suffix, "");
    for (int n = 2;; ++n) {
        auto candidate = base + " (" + std::to_string(n) + ")";
        if (!taken(candidate)) {
            return candidate;
        }
    }
}

auto JsonFileScriptStore::save(const ScriptDraft& draft)
    -> std::expected<ScriptRecord, StoreFailure> {
    std::unique_lock lock(mutex_);

    std::string id = draft.id && !draft.id->empty() ? *draft.id : generateId();
    if (!isValidId(id)) {
        return std::unexpected(
            StoreFailure{StoreError::InvalidRecord, "Invalid script id: " + id});
    }

    auto existing = load(id);
    auto all = listUnlocked();

    std::string name = trim(draft.name);
    if (name.empty()) {
        name = "Untitled";
    }

    if (!existing) {
        name = uniqueName(std::move(name), id, all);
    } else {
        auto lowered = toLower(name);
        bool conflict = std::any_of(
            all.begin(), all.end(), [&](const ScriptSummary& s) {
                return s.id != id && toLower(s.name) == lowered;
            });
        if (conflict) {
            return std::unexpected(
                StoreFailure{StoreError::NameConflict,
                             "A script with that name already exists."});
        }
    }

    auto now = nowMillis();
    ScriptRecord record;
    record.id = id;
    record.name = std::move(name);
    record.shell = draft.shell ? draft.shell
                               : std::optional(exec::defaultShellKind(platform_));
    record.content = draft.content;
    record.createdAt = existing ? existing->createdAt : now;
    record.updatedAt = now;

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected(StoreFailure{
            StoreError::IoFailure,
            "Cannot create " + directory_.string() + ": " + ec.message()});
    }

    auto path = recordPath(id);
    auto tmpPath = path;
    tmpPath += ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file) {
            return std::unexpected(StoreFailure{
                StoreError::IoFailure, "Cannot write " + tmpPath.string()});
        }
        file << record.toJson().dump(2);
        if (!file.flush()) {
            return std::unexpected(StoreFailure{
                StoreError::IoFailure, "Cannot write " + tmpPath.string()});
        }
    }
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::filesystem::remove(tmpPath, ec);
        return std::unexpected(StoreFailure{
            StoreError::IoFailure, "Cannot replace " + path.string()});
    }

    spdlog::debug("JsonFileScriptStore: saved '{}' ({})", record.name,
                  record.id);
    return record;
}

bool JsonFileScriptStore::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (!isValidId(id)) {
        return false;
    }
    std::error_code ec;
    bool removed = std::filesystem::remove(recordPath(id), ec);
    if (ec) {
        spdlog::warn("JsonFileScriptStore: cannot delete '{}': {}", id,
                     ec.message());
        return false;
    }
    if (removed) {
        spdlog::debug("JsonFileScriptStore: deleted '{}'", id);
    }
    return removed;
}

}  // namespace scriptdeck::store
