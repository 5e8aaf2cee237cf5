/*
 * config_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file config_store.hpp
 * @brief Durable JSON document store shared by the agent processes
 *
 * Each named document lives in `<dir>/<name>.json`, wrapped as
 * `{"timestamp": ..., "data": ...}`. Writers serialize on a per-document
 * lock file and replace the file with an atomic rename, so a reader in any
 * process sees either the previous or the new document. Reads are served
 * from an in-process cache as long as the file's modification time still
 * matches the one recorded when the entry was cached.
 */

#ifndef BMTL_STORE_CONFIG_STORE_HPP
#define BMTL_STORE_CONFIG_STORE_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <sys/stat.h>

#include <nlohmann/json.hpp>

#include "document_names.hpp"

namespace bmtl::store {

using json = nlohmann::json;

struct StoreDirectories {
    std::filesystem::path persistent{"/etc/bmtl-device"};
    std::filesystem::path runtime{"/opt/bmtl-device/tmp"};
};

class ConfigStore {
public:
    /**
     * @brief Open the store, creating its directories
     *
     * A directory that cannot be created or written falls back to a
     * directory under the system temporary path.
     *
     * @throws StoreIOException when neither location is usable
     */
    explicit ConfigStore(const StoreDirectories& dirs);

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    /**
     * @brief Atomically replace a document
     * @throws StoreIOException on I/O failure; the previous file is kept
     */
    void write(std::string_view name, const json& document);

    /**
     * @brief Last fully written document, or std::nullopt if none exists
     * @throws StoreFormatException when the file holds invalid JSON
     * @throws StoreIOException when the file cannot be read
     */
    [[nodiscard]] std::optional<json> read(std::string_view name);

    /**
     * @brief read(), with an empty object for a missing document
     */
    [[nodiscard]] json readObject(std::string_view name);

    [[nodiscard]] bool exists(std::string_view name) const;

    /**
     * @return true if a document was removed
     */
    bool remove(std::string_view name);

    /**
     * @brief Names of all stored documents, sorted
     */
    [[nodiscard]] std::vector<std::string> list() const;

    void clearCache();

    [[nodiscard]] std::filesystem::path pathFor(std::string_view name) const;

    [[nodiscard]] const std::filesystem::path& persistentDir() const noexcept {
        return persistentDir_;
    }
    [[nodiscard]] const std::filesystem::path& runtimeDir() const noexcept {
        return runtimeDir_;
    }

private:
    /// Identity of one on-disk version of a document, from a single stat()
    struct FileStamp {
        dev_t device{};
        ino_t inode{};
        off_t size{};
        timespec modified{};
        timespec changed{};

        [[nodiscard]] bool operator==(const FileStamp& other) const noexcept;
    };

    struct CacheEntry {
        json data;
        FileStamp stamp;
    };

    /// nullopt when the file does not exist
    static std::optional<FileStamp> stampOf(const std::filesystem::path& path);

    void forget(const std::string& name);

    std::filesystem::path persistentDir_;
    std::filesystem::path runtimeDir_;

    mutable std::mutex cacheMutex_;
    std::unordered_map<std::string, CacheEntry> cache_;
};

}  // namespace bmtl::store

#endif  // BMTL_STORE_CONFIG_STORE_HPP
