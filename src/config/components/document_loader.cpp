/*
 * document_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "document_loader.hpp"

#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "../core/exception.hpp"
#include "system/atomic_file.hpp"

namespace bmtl::config {

namespace {

constexpr size_t MAX_DEPTH = 32;

json scalarToJson(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" || value == "on" ||
        value == "On" || value == "ON") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" || value == "off" ||
        value == "Off" || value == "OFF") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }

    // A leading zero keeps the scalar a string ("07" is an id, not 7).
    bool leadingZero = value.size() > 1 && value[0] == '0' &&
                       value.find('.') == std::string::npos;
    if (!leadingZero) {
        try {
            size_t pos = 0;
            long long intVal = std::stoll(value, &pos);
            if (pos == value.size()) {
                return json(intVal);
            }
        } catch (const std::logic_error&) {
        }
        try {
            size_t pos = 0;
            double floatVal = std::stod(value, &pos);
            if (pos == value.size()) {
                return json(floatVal);
            }
        } catch (const std::logic_error&) {
        }
    }

    return json(value);
}

json yamlNodeToJson(const YAML::Node& node, size_t depth) {
    if (depth > MAX_DEPTH) {
        THROW_INVALID_CONFIG_EXCEPTION("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar: {
            // Quoted scalars stay strings.
            if (node.Tag() == "!") {
                return json(node.as<std::string>());
            }
            return scalarToJson(node.as<std::string>());
        }

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1);
            }
            return obj;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return json(nullptr);
    }
    return json(nullptr);
}

YAML::Node jsonToYamlNode(const json& j) {
    YAML::Node node;

    if (j.is_null()) {
        node = YAML::Node(YAML::NodeType::Null);
    } else if (j.is_boolean()) {
        node = j.get<bool>();
    } else if (j.is_number_integer()) {
        node = j.get<int64_t>();
    } else if (j.is_number_unsigned()) {
        node = j.get<uint64_t>();
    } else if (j.is_number_float()) {
        node = j.get<double>();
    } else if (j.is_string()) {
        node = j.get<std::string>();
    } else if (j.is_array()) {
        for (const auto& item : j) {
            node.push_back(jsonToYamlNode(item));
        }
    } else if (j.is_object()) {
        for (auto& [key, value] : j.items()) {
            node[key] = jsonToYamlNode(value);
        }
    }

    return node;
}

}  // namespace

bool isJsonPath(const std::filesystem::path& path) {
    return path.extension() == ".json";
}

json parseYaml(std::string_view content) {
    try {
        YAML::Node root = YAML::Load(std::string(content));
        json result = yamlNodeToJson(root, 0);
        return result.is_null() ? json::object() : result;
    } catch (const YAML::Exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION("YAML parse error: ", e.what());
    }
}

std::string dumpYaml(const json& document) {
    YAML::Emitter out;
    out << jsonToYamlNode(document);
    return std::string(out.c_str()) + "\n";
}

json loadDocument(const std::filesystem::path& path) {
    std::string content;
    try {
        content = system::readFile(path);
    } catch (const std::system_error& e) {
        THROW_CONFIG_IO_EXCEPTION("Cannot read ", path.string(), ": ",
                                  e.what());
    }

    if (isJsonPath(path)) {
        try {
            return json::parse(content);
        } catch (const json::parse_error& e) {
            THROW_INVALID_CONFIG_EXCEPTION("JSON parse error in ",
                                           path.string(), ": ", e.what());
        }
    }
    return parseYaml(content);
}

void saveDocument(const std::filesystem::path& path, const json& document) {
    std::string content =
        isJsonPath(path) ? document.dump(4) + "\n" : dumpYaml(document);
    try {
        system::writeFileAtomically(path, content);
    } catch (const std::system_error& e) {
        THROW_CONFIG_IO_EXCEPTION("Cannot write ", path.string(), ": ",
                                  e.what());
    }
    spdlog::debug("Configuration saved to {}", path.string());
}

}  // namespace bmtl::config
