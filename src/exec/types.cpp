/*
 * types.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "types.hpp"

#include <algorithm>
#include <cctype>

namespace scriptdeck::exec {

auto shellKindFromString(std::string_view name) -> std::optional<ShellKind> {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lowered == "powershell") return ShellKind::PowerShell;
    if (lowered == "cmd") return ShellKind::Cmd;
    if (lowered == "bash") return ShellKind::Bash;
    if (lowered == "sh") return ShellKind::Sh;
    return std::nullopt;
}

auto ExecutionFailure::describe() const -> std::string {
    std::string text(executionErrorToString(code));
    if (!message.empty()) {
        text += ": " + message;
    }
    return text;
}

auto OutputEvent::toJson() const -> nlohmann::json {
    nlohmann::json j{{"id", scriptId},
                     {"type", std::string(outputEventKindToString(kind))}};
    if (kind == OutputEventKind::End) {
        j["code"] = exitCode ? nlohmann::json(*exitCode) : nlohmann::json();
    } else {
        j["message"] = payload;
    }
    return j;
}

}  // namespace scriptdeck::exec
