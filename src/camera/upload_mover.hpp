/*
 * upload_mover.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-10

Description: Moves uploaded captures from the upload to the backup
directory once they have settled

**************************************************/

#ifndef BMTL_CAMERA_UPLOAD_MOVER_HPP
#define BMTL_CAMERA_UPLOAD_MOVER_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <stop_token>
#include <string>
#include <vector>

namespace bmtl::camera {

struct UploadMoverOptions {
    std::filesystem::path uploadDir;
    std::filesystem::path backupDir;
    std::chrono::seconds settle{30};
    std::chrono::seconds scanInterval{20};
    std::vector<std::string> extensions{".jpg", ".jpeg", ".raw"};
};

/**
 * @brief Keeps the upload directory from growing on an unattended unit
 *
 * The uploader picks files up from the upload directory; a file counts as
 * uploaded once it has not been modified for the settle period and its
 * size stayed the same across scans spanning that period. Such files are
 * moved into the backup directory, keeping their names.
 */
class UploadMover {
public:
    using FileClock = std::filesystem::file_time_type::clock;

    explicit UploadMover(UploadMoverOptions options);

    /**
     * @brief One pass over the upload directory
     * @param now Current time on the file clock
     * @return Number of files moved
     */
    int scanOnce(FileClock::time_point now);

    void run(std::stop_token stop);

    [[nodiscard]] const UploadMoverOptions& options() const noexcept {
        return options_;
    }

private:
    struct Observation {
        std::uintmax_t size{0};
        FileClock::time_point since;
    };

    [[nodiscard]] bool isCapture(const std::filesystem::path& path) const;
    bool moveToBackup(const std::filesystem::path& source);

    UploadMoverOptions options_;
    std::map<std::string, Observation> observed_;
};

}  // namespace bmtl::camera

#endif  // BMTL_CAMERA_UPLOAD_MOVER_HPP
