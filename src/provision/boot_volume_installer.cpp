#include "provision/boot_volume_installer.hpp"

#include <cctype>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QThread>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace imprint {

namespace {

const char *const kFirstRunArgs[] = {
    " systemd.run=/boot/firstrun.sh",
    " systemd.run_success_action=reboot",
    " systemd.unit=kernel-command-line.target",
};

std::string removeAll(std::string value, const std::string &needle)
{
    size_t pos = value.find(needle);
    while (pos != std::string::npos) {
        value.erase(pos, needle.size());
        pos = value.find(needle, pos);
    }
    return value;
}

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

std::string exitStatusOf(const CommandResult &result)
{
    if (!result.started) {
        return "not started";
    }
    if (result.crashed) {
        return "crashed";
    }
    return std::to_string(result.exitCode);
}

// Owns a mounted boot partition. unmount() reports failure; the destructor
// is the fallback for exception paths and only logs.
class MountScope {
public:
    MountScope(CommandRunner &runner, const QString &mountPoint)
        : m_runner(runner)
        , m_mountPoint(mountPoint)
    {
    }

    ~MountScope()
    {
        if (m_released) {
            return;
        }
        const CommandResult result = m_runner.run(QStringLiteral("umount"), {m_mountPoint});
        QDir().rmdir(m_mountPoint);
        if (!result.succeeded()) {
            ILOG_ERROR(QStringLiteral("BootVolumeInstaller"),
                       QStringLiteral("MountScope::~MountScope"),
                       QStringLiteral("unmount_failed"),
                       QString::fromUtf8(result.standardError).trimmed(),
                       QStringLiteral("umount"),
                       logging::defaultWho(),
                       logging::currentCorrelationId(),
                       (nlohmann::json{{"mountPoint", m_mountPoint.toStdString()},
                                       {"exitStatus", exitStatusOf(result)}}));
        }
    }

    MountScope(const MountScope &) = delete;
    MountScope &operator=(const MountScope &) = delete;

    void unmount()
    {
        m_released = true;
        const CommandResult result = m_runner.run(QStringLiteral("umount"), {m_mountPoint});
        QDir().rmdir(m_mountPoint);
        if (!result.succeeded()) {
            throw ImprintError(ErrorKind::InstallError,
                               "Failed to unmount boot partition. Check if busy. Exit code: "
                                   + exitStatusOf(result));
        }
    }

private:
    CommandRunner &m_runner;
    QString m_mountPoint;
    bool m_released = false;
};

} // namespace

std::string bootPartitionFor(const std::string &devicePath)
{
    if (!devicePath.empty()
        && std::isdigit(static_cast<unsigned char>(devicePath.back()))) {
        return devicePath + "p1";
    }
    return devicePath + "1";
}

std::string patchCmdline(const std::string &cmdline)
{
    std::string patched = cmdline;
    for (const char *arg : kFirstRunArgs) {
        patched = removeAll(patched, arg);
    }
    patched = trim(patched);
    for (const char *arg : kFirstRunArgs) {
        patched += arg;
    }
    return patched;
}

BootVolumeInstaller::BootVolumeInstaller(CommandRunner &runner)
    : m_runner(runner)
    , m_mountRoot(QDir::tempPath())
{
}

void BootVolumeInstaller::setSettleDelays(std::chrono::milliseconds beforeProbe,
                                          std::chrono::milliseconds afterProbe)
{
    m_beforeProbe = beforeProbe;
    m_afterProbe = afterProbe;
}

void BootVolumeInstaller::setMountRoot(const QString &directory)
{
    m_mountRoot = directory;
}

QString BootVolumeInstaller::mountPointPath() const
{
    return QDir(m_mountRoot).filePath(
        QStringLiteral("imprint-mnt-%1").arg(QCoreApplication::applicationPid()));
}

bool BootVolumeInstaller::install(const TargetDevice &device, const std::string &script)
{
    const QString partition = QString::fromStdString(bootPartitionFor(device.path));
    const QString mountPoint = mountPointPath();

    ILOG_INFO(QStringLiteral("BootVolumeInstaller"),
              QStringLiteral("install"),
              QStringLiteral("install_started"),
              QStringLiteral("customization_requested"),
              QStringLiteral("mount_write_patch"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"device", device.path},
                              {"partition", partition.toStdString()},
                              {"mountPoint", mountPoint.toStdString()}}));

    if (!QDir().mkpath(mountPoint)) {
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to create temp mount point " + mountPoint.toStdString());
    }

    QThread::msleep(static_cast<unsigned long>(m_beforeProbe.count()));
    const CommandResult probe =
        m_runner.run(QStringLiteral("partprobe"), {QString::fromStdString(device.path)});
    if (!probe.succeeded()) {
        ILOG_WARN(QStringLiteral("BootVolumeInstaller"),
                  QStringLiteral("install"),
                  QStringLiteral("partprobe_failed"),
                  QString::fromUtf8(probe.standardError).trimmed(),
                  QStringLiteral("continue_to_mount"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"exitStatus", exitStatusOf(probe)}}));
    }
    QThread::msleep(static_cast<unsigned long>(m_afterProbe.count()));

    const CommandResult mounted = m_runner.run(QStringLiteral("mount"), {partition, mountPoint});
    if (!mounted.succeeded()) {
        QDir().rmdir(mountPoint);
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to mount boot partition " + partition.toStdString()
                               + ". Exit code: " + exitStatusOf(mounted));
    }

    MountScope scope(m_runner, mountPoint);
    const bool patched = writeBootFiles(mountPoint, script);
    scope.unmount();

    ILOG_INFO(QStringLiteral("BootVolumeInstaller"),
              QStringLiteral("install"),
              QStringLiteral("install_finished"),
              QStringLiteral("customization_requested"),
              QStringLiteral("mount_write_patch"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"cmdlinePatched", patched}}));
    return patched;
}

bool BootVolumeInstaller::writeBootFiles(const QString &mountPoint, const std::string &script)
{
    const QDir boot(mountPoint);

    QFile scriptFile(boot.filePath(QStringLiteral("firstrun.sh")));
    if (!scriptFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to write firstrun.sh: " + scriptFile.errorString().toStdString());
    }
    const QByteArray scriptBytes = QByteArray::fromStdString(script);
    if (scriptFile.write(scriptBytes) != scriptBytes.size() || !scriptFile.flush()) {
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to write firstrun.sh: " + scriptFile.errorString().toStdString());
    }
    scriptFile.close();

    // FAT boot partitions have no mode bits; the kernel runs the script via
    // systemd.run regardless.
    if (!scriptFile.setPermissions(scriptFile.permissions() | QFileDevice::ExeOwner
                                   | QFileDevice::ExeGroup | QFileDevice::ExeOther)) {
        ILOG_DEBUG(QStringLiteral("BootVolumeInstaller"),
                   QStringLiteral("writeBootFiles"),
                   QStringLiteral("chmod_unsupported"),
                   QStringLiteral("filesystem_without_modes"),
                   QStringLiteral("qfile_permissions"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   nlohmann::json::object());
    }

    const QString cmdlinePath = boot.filePath(QStringLiteral("cmdline.txt"));
    if (!QFile::exists(cmdlinePath)) {
        ILOG_WARN(QStringLiteral("BootVolumeInstaller"),
                  QStringLiteral("writeBootFiles"),
                  QStringLiteral("cmdline_missing"),
                  QStringLiteral("unrecognised_boot_layout"),
                  QStringLiteral("skip_patch"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"path", cmdlinePath.toStdString()}}));
        return false;
    }

    QFile cmdlineIn(cmdlinePath);
    if (!cmdlineIn.open(QIODevice::ReadOnly)) {
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to read cmdline.txt: " + cmdlineIn.errorString().toStdString());
    }
    const std::string original = cmdlineIn.readAll().toStdString();
    cmdlineIn.close();

    // Written in place; QSaveFile's rename dance is not reliable on vfat.
    QFile cmdlineOut(cmdlinePath);
    const QByteArray patched = QByteArray::fromStdString(patchCmdline(original));
    if (!cmdlineOut.open(QIODevice::WriteOnly | QIODevice::Truncate)
        || cmdlineOut.write(patched) != patched.size() || !cmdlineOut.flush()) {
        throw ImprintError(ErrorKind::InstallError,
                           "Failed to update cmdline.txt: " + cmdlineOut.errorString().toStdString());
    }
    return true;
}

} // namespace imprint
