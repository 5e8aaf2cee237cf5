/*
 * document_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-02

Description: Load and save configuration documents as YAML or JSON

**************************************************/

#ifndef BMTL_CONFIG_COMPONENTS_DOCUMENT_LOADER_HPP
#define BMTL_CONFIG_COMPONENTS_DOCUMENT_LOADER_HPP

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace bmtl::config {

using json = nlohmann::json;

/**
 * @brief Format is chosen by extension: `.json` is JSON, anything else YAML
 */
[[nodiscard]] bool isJsonPath(const std::filesystem::path& path);

/**
 * @brief Parse YAML text into a JSON tree
 *
 * Scalars are typed the way YAML 1.1 readers expect: true/yes/on are
 * booleans, integers and floats become numbers, `~` and empty are null.
 *
 * @throws InvalidConfigException on a syntax error
 */
[[nodiscard]] json parseYaml(std::string_view content);

[[nodiscard]] std::string dumpYaml(const json& document);

/**
 * @brief Load a configuration file
 * @throws ConfigIOException when the file cannot be read
 * @throws InvalidConfigException when it cannot be parsed
 */
[[nodiscard]] json loadDocument(const std::filesystem::path& path);

/**
 * @brief Atomically replace a configuration file
 * @throws ConfigIOException on failure
 */
void saveDocument(const std::filesystem::path& path, const json& document);

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_COMPONENTS_DOCUMENT_LOADER_HPP
