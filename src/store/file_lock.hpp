/*
 * file_lock.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_STORE_FILE_LOCK_HPP
#define BMTL_STORE_FILE_LOCK_HPP

#include <filesystem>

namespace bmtl::store {

/**
 * @brief Exclusive advisory lock on `<target>.lock`, shared across processes
 *
 * The lock file is removed on release. Because a waiter may still hold a
 * descriptor for the removed inode, acquisition re-checks that the locked
 * descriptor and the path name the same file and retries otherwise.
 */
class FileLock {
public:
    /**
     * @brief Block until the lock for @p target is held
     * @throws StoreIOException when the lock file cannot be created
     */
    explicit FileLock(const std::filesystem::path& target);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] const std::filesystem::path& lockPath() const noexcept {
        return lockPath_;
    }

    [[nodiscard]] static std::filesystem::path lockPathFor(
        const std::filesystem::path& target);

private:
    std::filesystem::path lockPath_;
    int fd_{-1};
};

}  // namespace bmtl::store

#endif  // BMTL_STORE_FILE_LOCK_HPP
