/*
 * atomic_file.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "atomic_file.hpp"

#include <cerrno>
#include <cstdio>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace bmtl::system {

namespace {

constexpr std::string_view TEMP_MARKER = ".tmp-";

[[noreturn]] void throwErrno(int err, const std::string& what) {
    throw std::system_error(err, std::generic_category(), what);
}

void syncDirectory(const std::filesystem::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
}

}  // namespace

void writeFileAtomically(const std::filesystem::path& target,
                         std::string_view content) {
    auto dir = target.parent_path();
    if (dir.empty()) {
        dir = ".";
    }

    std::string pattern =
        (dir / ("." + target.filename().string() + std::string(TEMP_MARKER) +
                "XXXXXX"))
            .string();
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');

    int fd = ::mkostemp(tmpl.data(), O_CLOEXEC);
    if (fd < 0) {
        throwErrno(errno, "cannot create temporary file in " + dir.string());
    }
    std::string tempPath(tmpl.data());

    auto fail = [&](const std::string& what) {
        int err = errno;
        ::close(fd);
        ::unlink(tempPath.c_str());
        throwErrno(err, what + " " + tempPath);
    };

    size_t written = 0;
    while (written < content.size()) {
        auto n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail("write failed for");
        }
        written += static_cast<size_t>(n);
    }

    if (::fchmod(fd, 0644) != 0) {
        fail("chmod failed for");
    }
    if (::fsync(fd) != 0) {
        fail("fsync failed for");
    }
    if (::close(fd) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        throwErrno(err, "close failed for " + tempPath);
    }

    if (::rename(tempPath.c_str(), target.c_str()) != 0) {
        int err = errno;
        ::unlink(tempPath.c_str());
        throwErrno(err, "rename failed for " + target.string());
    }

    syncDirectory(dir);
}

std::string readFile(const std::filesystem::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throwErrno(errno, "cannot open " + path.string());
    }

    std::string data;
    char buffer[8192];
    while (true) {
        auto n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            ::close(fd);
            throwErrno(err, "cannot read " + path.string());
        }
        if (n == 0) {
            break;
        }
        data.append(buffer, static_cast<size_t>(n));
    }
    ::close(fd);
    return data;
}

bool isTransientFileName(std::string_view name) noexcept {
    if (name.ends_with(".lock")) {
        return true;
    }
    return name.starts_with('.') && name.find(TEMP_MARKER) != std::string_view::npos;
}

}  // namespace bmtl::system
