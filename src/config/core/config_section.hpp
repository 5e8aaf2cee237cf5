/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: ConfigSection CRTP base class for type-safe configuration sections

**************************************************/

#ifndef BMTL_CONFIG_CORE_CONFIG_SECTION_HPP
#define BMTL_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <string_view>

#include <nlohmann/json.hpp>

namespace bmtl::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
};

/**
 * @brief CRTP base class for type-safe configuration sections
 *
 * Derived classes define a static constexpr PATH naming their key in the
 * configuration file, serialize() and a static deserialize(const json&)
 * that falls back to the member defaults for every missing key.
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 */
template <typename Derived>
class ConfigSection {
public:
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Read this section out of the whole configuration document
     *
     * A missing or non-object section yields the defaults.
     */
    [[nodiscard]] static Derived fromRoot(const json& root) {
        const std::string key(Derived::PATH);
        if (root.is_object() && root.contains(key) && root[key].is_object()) {
            return Derived::deserialize(root[key]);
        }
        return Derived{};
    }

    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Keys whose values differ from @p other
     */
    [[nodiscard]] json diff(const Derived& other) const {
        json result = json::object();
        auto mine = toJson();
        auto theirs = other.toJson();
        for (auto& [key, value] : theirs.items()) {
            if (!mine.contains(key) || mine[key] != value) {
                result[key] = value;
            }
        }
        return result;
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_CORE_CONFIG_SECTION_HPP
