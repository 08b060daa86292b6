/*
 * memory_repository.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "memory_repository.hpp"

#include <mutex>
#include <utility>

namespace scriptdeck::store {

auto MemoryScriptRepository::get(const std::string& id)
    -> std::optional<ScriptRecord> {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryScriptRepository::put(ScriptRecord record) {
    std::unique_lock lock(mutex_);
    auto id = record.id;
    records_.insert_or_assign(std::move(id), std::move(record));
}

bool MemoryScriptRepository::remove(const std::string& id) {
    std::unique_lock lock(mutex_);
    return records_.erase(id) > 0;
}

auto MemoryScriptRepository::count() const -> size_t {
    std::shared_lock lock(mutex_);
    return records_.size();
}

}  // namespace scriptdeck::store
