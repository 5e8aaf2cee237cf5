/*
 * device_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef BMTL_CONFIG_SECTIONS_DEVICE_CONFIG_HPP
#define BMTL_CONFIG_SECTIONS_DEVICE_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace bmtl::config {

/**
 * @brief Identity of the unit and its capture directories
 *
 * ```yaml
 * device:
 *   id: "07"          # empty: derived from the host name
 *   location: North Ridge
 *   upload_path: /opt/bmtl-device/upload
 * ```
 */
struct DeviceConfig : ConfigSection<DeviceConfig> {
    static constexpr std::string_view PATH = "device";

    std::string id;
    std::string location{"unknown"};
    std::string uploadPath{"/opt/bmtl-device/upload"};
    std::string backupPath{"/opt/bmtl-device/backup"};
    int backupSettleSeconds{30};  ///< Unmodified this long before moving
    int backupScanSeconds{20};
    std::string storagePath{"/opt/bmtl-device"};  ///< Filesystem reported in health

    [[nodiscard]] json serialize() const {
        return {{"id", id},
                {"location", location},
                {"upload_path", uploadPath},
                {"backup_path", backupPath},
                {"backup_settle_seconds", backupSettleSeconds},
                {"backup_scan_seconds", backupScanSeconds},
                {"storage_path", storagePath}};
    }

    [[nodiscard]] static DeviceConfig deserialize(const json& j) {
        DeviceConfig cfg;
        // Ids are often written unquoted in YAML (id: 07).
        if (j.contains("id") && j["id"].is_number_integer()) {
            cfg.id = std::to_string(j["id"].get<long long>());
            if (cfg.id.size() < 2) {
                cfg.id.insert(0, 2 - cfg.id.size(), '0');
            }
        } else {
            cfg.id = j.value("id", cfg.id);
        }
        cfg.location = j.value("location", cfg.location);
        cfg.uploadPath = j.value("upload_path", cfg.uploadPath);
        cfg.backupPath = j.value("backup_path", cfg.backupPath);
        cfg.backupSettleSeconds =
            j.value("backup_settle_seconds", cfg.backupSettleSeconds);
        cfg.backupScanSeconds = j.value("backup_scan_seconds", cfg.backupScanSeconds);
        cfg.storagePath = j.value("storage_path", cfg.storagePath);
        return cfg;
    }
};

}  // namespace bmtl::config

#endif  // BMTL_CONFIG_SECTIONS_DEVICE_CONFIG_HPP
