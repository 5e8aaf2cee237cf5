/*
 * config_store.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "config_store.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <set>
#include <system_error>

#include <unistd.h>

#include <spdlog/spdlog.h>

#include "exception.hpp"
#include "file_lock.hpp"
#include "system/atomic_file.hpp"
#include "system/local_time.hpp"

namespace bmtl::store {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view EXTENSION = ".json";

bool isUsableDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec && !fs::is_directory(dir)) {
        return false;
    }
    return ::access(dir.c_str(), W_OK | X_OK) == 0;
}

fs::path prepareDirectory(const fs::path& preferred, std::string_view fallbackName) {
    if (isUsableDirectory(preferred)) {
        return preferred;
    }

    std::error_code ec;
    auto fallback = fs::temp_directory_path(ec) / fallbackName;
    if (ec) {
        fallback = fs::path("/tmp") / fallbackName;
    }
    spdlog::warn("Directory {} is not writable, using {}", preferred.string(),
                 fallback.string());
    if (!isUsableDirectory(fallback)) {
        THROW_STORE_IO_ERROR("Cannot create store directory ",
                             preferred.string(), " or fallback ",
                             fallback.string());
    }
    return fallback;
}

void validateName(std::string_view name) {
    if (name.empty() || name.front() == '.' ||
        name.find('/') != std::string_view::npos ||
        name.find('\0') != std::string_view::npos) {
        THROW_INVALID_DOCUMENT_NAME("Invalid document name '",
                                    std::string(name), "'");
    }
}

json unwrap(json document) {
    if (document.is_object() && document.contains("data") &&
        document.contains("timestamp")) {
        return std::move(document["data"]);
    }
    // Bare documents written by older releases.
    return document;
}

}  // namespace

bool ConfigStore::FileStamp::operator==(const FileStamp& other) const noexcept {
    return device == other.device && inode == other.inode && size == other.size &&
           modified.tv_sec == other.modified.tv_sec &&
           modified.tv_nsec == other.modified.tv_nsec &&
           changed.tv_sec == other.changed.tv_sec &&
           changed.tv_nsec == other.changed.tv_nsec;
}

std::optional<ConfigStore::FileStamp> ConfigStore::stampOf(const fs::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            return std::nullopt;
        }
        THROW_STORE_IO_ERROR("Cannot stat ", path.string(), ": ",
                             std::strerror(errno));
    }
    return FileStamp{st.st_dev, st.st_ino, st.st_size, st.st_mtim, st.st_ctim};
}

ConfigStore::ConfigStore(const StoreDirectories& dirs)
    : persistentDir_(prepareDirectory(dirs.persistent, "bmtl-etc")),
      runtimeDir_(prepareDirectory(dirs.runtime, "bmtl-config")) {
    spdlog::debug("Config store: persistent={}, runtime={}",
                  persistentDir_.string(), runtimeDir_.string());
}

fs::path ConfigStore::pathFor(std::string_view name) const {
    validateName(name);
    const auto& dir = storageClassOf(name) == StorageClass::Persistent
                          ? persistentDir_
                          : runtimeDir_;
    return dir / (std::string(name) + std::string(EXTENSION));
}

void ConfigStore::write(std::string_view name, const json& document) {
    auto path = pathFor(name);
    json wrapped = {{"timestamp", system::nowTimestamp()}, {"data", document}};

    FileLock lock(path);
    try {
        system::writeFileAtomically(path, wrapped.dump(2));
    } catch (const std::system_error& e) {
        forget(std::string(name));
        THROW_STORE_IO_ERROR("Failed to write ", std::string(name), ": ",
                             e.what());
    }

    // Still under the lock, so the stamp belongs to the bytes just written.
    std::optional<FileStamp> stamp;
    try {
        stamp = stampOf(path);
    } catch (const StoreException& e) {
        spdlog::warn("Not caching {}: {}", std::string(name), e.what());
    }

    std::lock_guard guard(cacheMutex_);
    if (!stamp) {
        cache_.erase(std::string(name));
    } else {
        cache_[std::string(name)] = CacheEntry{document, *stamp};
    }
}

std::optional<json> ConfigStore::read(std::string_view name) {
    auto path = pathFor(name);
    std::string key(name);

    auto stamp = stampOf(path);
    if (!stamp) {
        forget(key);
        return std::nullopt;
    }

    {
        std::lock_guard guard(cacheMutex_);
        if (auto it = cache_.find(key);
            it != cache_.end() && it->second.stamp == *stamp) {
            return it->second.data;
        }
    }

    FileLock lock(path);

    // Re-check under the lock: the file may have been replaced or removed.
    stamp = stampOf(path);
    if (!stamp) {
        forget(key);
        return std::nullopt;
    }

    std::string content;
    try {
        content = system::readFile(path);
    } catch (const std::system_error& e) {
        THROW_STORE_IO_ERROR("Failed to read ", key, ": ", e.what());
    }

    json parsed;
    try {
        parsed = json::parse(content);
    } catch (const json::parse_error& e) {
        forget(key);
        THROW_STORE_FORMAT_ERROR("Document ", key, " is not valid JSON: ",
                                 e.what());
    }

    json data = unwrap(std::move(parsed));
    {
        std::lock_guard guard(cacheMutex_);
        cache_[key] = CacheEntry{data, *stamp};
    }
    return data;
}

json ConfigStore::readObject(std::string_view name) {
    auto doc = read(name);
    if (!doc || !doc->is_object()) {
        return json::object();
    }
    return std::move(*doc);
}

bool ConfigStore::exists(std::string_view name) const {
    std::error_code ec;
    return fs::exists(pathFor(name), ec);
}

bool ConfigStore::remove(std::string_view name) {
    auto path = pathFor(name);
    bool removed = false;
    {
        FileLock lock(path);
        std::error_code ec;
        removed = fs::remove(path, ec);
        if (ec) {
            THROW_STORE_IO_ERROR("Failed to delete ", std::string(name), ": ",
                                 ec.message());
        }
    }
    forget(std::string(name));
    return removed;
}

std::vector<std::string> ConfigStore::list() const {
    std::set<std::string> names;
    for (const auto& dir : {persistentDir_, runtimeDir_}) {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            auto filename = entry.path().filename().string();
            if (system::isTransientFileName(filename) ||
                !filename.ends_with(EXTENSION)) {
                continue;
            }
            names.insert(filename.substr(0, filename.size() - EXTENSION.size()));
        }
    }
    return {names.begin(), names.end()};
}

void ConfigStore::clearCache() {
    std::lock_guard guard(cacheMutex_);
    cache_.clear();
}

void ConfigStore::forget(const std::string& name) {
    std::lock_guard guard(cacheMutex_);
    cache_.erase(name);
}

}  // namespace bmtl::store
