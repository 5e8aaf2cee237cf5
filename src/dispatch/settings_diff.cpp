/*
 * settings_diff.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "settings_diff.hpp"

#include <spdlog/spdlog.h>

#include "store/config_store.hpp"

namespace bmtl::dispatch {

json changedFields(const json& existing, const json& update) {
    json changed = json::object();
    if (!update.is_object()) {
        return changed;
    }
    for (const auto& [key, value] : update.items()) {
        if (!existing.is_object() || !existing.contains(key) || existing[key] != value) {
            changed[key] = value;
        }
    }
    return changed;
}

MergeResult mergeDocument(store::ConfigStore& store, std::string_view name,
                          const json& update) {
    MergeResult result;
    auto existing = store.readObject(name);
    if (!existing.is_object()) {
        existing = json::object();
    }

    result.changed = changedFields(existing, update);
    result.merged = existing;
    if (result.changed.empty()) {
        spdlog::debug("{} unchanged, skipping write", name);
        return result;
    }

    result.merged.update(result.changed);
    store.write(name, result.merged);
    result.written = true;
    spdlog::info("{} updated: {}", name, result.changed.dump());
    return result;
}

}  // namespace bmtl::dispatch
