/*
 * settings_diff.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_DISPATCH_SETTINGS_DIFF_HPP
#define BMTL_DISPATCH_SETTINGS_DIFF_HPP

#include <string_view>

#include <nlohmann/json.hpp>

namespace bmtl::store {
class ConfigStore;
}

namespace bmtl::dispatch {

using json = nlohmann::json;

/**
 * @brief Fields of @p update whose value differs from @p existing
 */
[[nodiscard]] json changedFields(const json& existing, const json& update);

struct MergeResult {
    json changed = json::object();  ///< Fields that were different
    json merged = json::object();   ///< Document after the merge
    bool written{false};
};

/**
 * @brief Merge @p update into a stored document, writing only on change
 *
 * @throws store exceptions when the document cannot be read or written
 */
MergeResult mergeDocument(store::ConfigStore& store, std::string_view name,
                          const json& update);

}  // namespace bmtl::dispatch

#endif  // BMTL_DISPATCH_SETTINGS_DIFF_HPP
