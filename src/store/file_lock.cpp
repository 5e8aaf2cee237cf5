/*
 * file_lock.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "file_lock.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "exception.hpp"

namespace bmtl::store {

std::filesystem::path FileLock::lockPathFor(
    const std::filesystem::path& target) {
    auto path = target;
    path += ".lock";
    return path;
}

FileLock::FileLock(const std::filesystem::path& target)
    : lockPath_(lockPathFor(target)) {
    while (true) {
        int fd = ::open(lockPath_.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            THROW_STORE_IO_ERROR("Cannot open lock file ", lockPath_.string(),
                                 ": ", std::strerror(errno));
        }

        int rc;
        do {
            rc = ::flock(fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd);
            THROW_STORE_IO_ERROR("Cannot lock ", lockPath_.string(), ": ",
                                 std::strerror(err));
        }

        struct stat held {};
        struct stat current {};
        if (::fstat(fd, &held) == 0 && ::stat(lockPath_.c_str(), &current) == 0 &&
            held.st_ino == current.st_ino && held.st_dev == current.st_dev) {
            fd_ = fd;
            return;
        }

        // The previous holder removed the file while we waited on it.
        ::close(fd);
    }
}

FileLock::~FileLock() {
    if (fd_ < 0) {
        return;
    }
    // Unlink before unlocking so no new opener can lock the old inode.
    if (::unlink(lockPath_.c_str()) != 0 && errno != ENOENT) {
        spdlog::debug("Cannot remove lock file {}: {}", lockPath_.string(),
                      std::strerror(errno));
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

}  // namespace bmtl::store
