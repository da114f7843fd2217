#pragma once

#include <chrono>
#include <string>

#include <QString>

#include "common/models.hpp"
#include "common/process_utils.hpp"

namespace imprint {

// First partition node of a whole-disk path: "/dev/mmcblk0" -> "/dev/mmcblk0p1",
// "/dev/sdb" -> "/dev/sdb1".
std::string bootPartitionFor(const std::string &devicePath);

// Returns cmdline.txt contents with the first-boot arguments appended exactly
// once. Any earlier copies are removed and surrounding whitespace trimmed.
std::string patchCmdline(const std::string &cmdline);

/**
 * Installs the first-boot script onto a freshly written card.
 *
 * install() mounts the boot partition under a pid-qualified directory,
 * writes firstrun.sh and patches cmdline.txt to run it once. The partition
 * is unmounted and the directory removed on every path out.
 *
 * Returns false when cmdline.txt is missing (the script is still written);
 * throws ImprintError(InstallError) when mounting, writing or unmounting
 * fails.
 */
class BootVolumeInstaller {
public:
    explicit BootVolumeInstaller(CommandRunner &runner);

    // Delays around partprobe for the kernel to pick up the new table.
    void setSettleDelays(std::chrono::milliseconds beforeProbe,
                         std::chrono::milliseconds afterProbe);
    void setMountRoot(const QString &directory);

    QString mountPointPath() const;

    bool install(const TargetDevice &device, const std::string &script);

private:
    bool writeBootFiles(const QString &mountPoint, const std::string &script);

    CommandRunner &m_runner;
    std::chrono::milliseconds m_beforeProbe{2000};
    std::chrono::milliseconds m_afterProbe{1000};
    QString m_mountRoot;
};

} // namespace imprint
