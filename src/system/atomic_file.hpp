/*
 * atomic_file.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_SYSTEM_ATOMIC_FILE_HPP
#define BMTL_SYSTEM_ATOMIC_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace bmtl::system {

/**
 * @brief Replace @p target with @p content in one rename
 *
 * The content is written to a temporary sibling, fsynced, then renamed over
 * the target, so a reader sees either the old or the new file. On error the
 * temporary file is removed and std::system_error is thrown; the target is
 * left untouched.
 */
void writeFileAtomically(const std::filesystem::path& target,
                         std::string_view content);

/**
 * @brief Read a whole file
 * @throws std::system_error when the file cannot be opened or read
 */
[[nodiscard]] std::string readFile(const std::filesystem::path& path);

/**
 * @brief True for names produced by writeFileAtomically() or lock files
 */
[[nodiscard]] bool isTransientFileName(std::string_view name) noexcept;

}  // namespace bmtl::system

#endif  // BMTL_SYSTEM_ATOMIC_FILE_HPP
