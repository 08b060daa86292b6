/*
 * script_record.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "script_record.hpp"

#include <chrono>

namespace scriptdeck::store {

namespace {

auto shellToJson(const std::optional<exec::ShellKind>& shell)
    -> nlohmann::json {
    if (!shell) {
        return nullptr;
    }
    return std::string(exec::shellKindToString(*shell));
}

auto shellFromJson(const nlohmann::json& j)
    -> std::optional<exec::ShellKind> {
    if (!j.contains("shell") || !j["shell"].is_string()) {
        return std::nullopt;
    }
    return exec::shellKindFromString(j["shell"].get<std::string>());
}

}  // namespace

auto ScriptRecord::toJson() const -> nlohmann::json {
    return {{"id", id},
            {"name", name},
            {"shell", shellToJson(shell)},
            {"content", content},
            {"createdAt", createdAt},
            {"updatedAt", updatedAt}};
}

auto ScriptRecord::fromJson(const nlohmann::json& j)
    -> std::optional<ScriptRecord> {
    if (!j.is_object() || !j.contains("id") || !j["id"].is_string() ||
        !j.contains("name") || !j["name"].is_string()) {
        return std::nullopt;
    }

    ScriptRecord record;
    record.id = j["id"].get<std::string>();
    record.name = j["name"].get<std::string>();
    record.shell = shellFromJson(j);
    record.content = j.value("content", std::string{});
    record.createdAt = j.value("createdAt", int64_t{0});
    record.updatedAt = j.value("updatedAt", int64_t{0});
    return record;
}

auto ScriptSummary::toJson() const -> nlohmann::json {
    return {{"id", id},
            {"name", name},
            {"shell", shellToJson(shell)},
            {"updatedAt", updatedAt}};
}

auto nowMillis() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace scriptdeck::store
