#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace imprint {

// "1.50 GB", "512 MB", "900 B": binary units, TB/GB with two decimals.
std::string formatSize(std::uint64_t bytes);

/**
 * Parse `lsblk -J -b -o NAME,SIZE,MODEL,TYPE,MOUNTPOINT,LABEL,RM,RO`.
 *
 * Keeps whole disks only. Sizes may be numbers or decimal strings; rm/ro may
 * be booleans, "1"/"true" or 1. Mountpoints of all partitions are collected
 * and a disk mounted at "/" is flagged as the system drive.
 * Throws ImprintError(DeviceUnavailable) for output that is not lsblk JSON.
 */
std::vector<TargetDevice> parseLsblk(const std::string &json);

// Runs lsblk through the runner. System drives are dropped unless includeSystem.
std::vector<TargetDevice> listDrives(CommandRunner &runner, bool includeSystem = false);

} // namespace imprint
