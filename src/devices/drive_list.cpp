#include "devices/drive_list.hpp"

#include <algorithm>

#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace imprint {

namespace {

bool isTrue(const nlohmann::json &device, const char *key)
{
    const auto it = device.find(key);
    if (it == device.end()) {
        return false;
    }
    if (it->is_boolean()) {
        return it->get<bool>();
    }
    if (it->is_string()) {
        const QString value = QString::fromStdString(it->get<std::string>());
        return value == QLatin1String("1") || value.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
    }
    if (it->is_number_integer()) {
        return it->get<long long>() == 1;
    }
    return false;
}

std::uint64_t parseSize(const nlohmann::json &device)
{
    const auto it = device.find("size");
    if (it == device.end() || it->is_null()) {
        return 0;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_string()) {
        bool ok = false;
        const qulonglong value = QString::fromStdString(it->get<std::string>()).toULongLong(&ok);
        if (ok) {
            return value;
        }
    }
    throw ImprintError(ErrorKind::DeviceUnavailable, "lsblk reported an invalid size");
}

std::string optionalText(const nlohmann::json &device, const char *key)
{
    const auto it = device.find(key);
    if (it == device.end() || !it->is_string()) {
        return std::string();
    }
    return QString::fromStdString(it->get<std::string>()).trimmed().toStdString();
}

void collectMountpoints(const nlohmann::json &device, std::vector<std::string> &mountpoints)
{
    const std::string mountpoint = optionalText(device, "mountpoint");
    if (!mountpoint.empty()) {
        mountpoints.push_back(mountpoint);
    }
    const auto children = device.find("children");
    if (children != device.end() && children->is_array()) {
        for (const auto &child : *children) {
            collectMountpoints(child, mountpoints);
        }
    }
}

} // namespace

std::string formatSize(std::uint64_t bytes)
{
    constexpr std::uint64_t kKiB = 1024;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;
    constexpr std::uint64_t kTiB = kGiB * 1024;

    const double value = static_cast<double>(bytes);
    if (bytes >= kTiB) {
        return QString::number(value / kTiB, 'f', 2).toStdString() + " TB";
    }
    if (bytes >= kGiB) {
        return QString::number(value / kGiB, 'f', 2).toStdString() + " GB";
    }
    if (bytes >= kMiB) {
        return QString::number(value / kMiB, 'f', 0).toStdString() + " MB";
    }
    return std::to_string(bytes) + " B";
}

std::vector<TargetDevice> parseLsblk(const std::string &json)
{
    const auto root = nlohmann::json::parse(json, nullptr, false);
    if (root.is_discarded() || !root.is_object()
        || !root.contains("blockdevices") || !root.at("blockdevices").is_array()) {
        throw ImprintError(ErrorKind::DeviceUnavailable, "lsblk output is not valid JSON");
    }

    std::vector<TargetDevice> drives;
    for (const auto &device : root.at("blockdevices")) {
        if (!device.is_object() || optionalText(device, "type") != "disk") {
            continue;
        }
        const std::string name = optionalText(device, "name");
        if (name.empty()) {
            continue;
        }

        TargetDevice drive;
        drive.path = "/dev/" + name;
        drive.size = parseSize(device);
        drive.isRemovable = isTrue(device, "rm");
        drive.isReadonly = isTrue(device, "ro");
        collectMountpoints(device, drive.mountpoints);
        drive.isSystem = std::find(drive.mountpoints.begin(), drive.mountpoints.end(), "/")
            != drive.mountpoints.end();

        std::string model = optionalText(device, "model");
        if (model.empty()) {
            model = "Unknown";
        }
        const std::string label = optionalText(device, "label");
        drive.description = label.empty()
            ? model + " (" + formatSize(drive.size) + ")"
            : model + " - " + label + " (" + formatSize(drive.size) + ")";

        drives.push_back(std::move(drive));
    }
    return drives;
}

std::vector<TargetDevice> listDrives(CommandRunner &runner, bool includeSystem)
{
    const CommandResult result = runner.run(
        QStringLiteral("lsblk"),
        {QStringLiteral("-J"), QStringLiteral("-b"), QStringLiteral("-o"),
         QStringLiteral("NAME,SIZE,MODEL,TYPE,MOUNTPOINT,LABEL,RM,RO")});
    if (!result.succeeded()) {
        throw ImprintError(ErrorKind::DeviceUnavailable,
                           "lsblk failed: " + QString::fromUtf8(result.standardError).trimmed().toStdString());
    }

    std::vector<TargetDevice> drives = parseLsblk(result.standardOutput.toStdString());
    if (!includeSystem) {
        drives.erase(std::remove_if(drives.begin(), drives.end(),
                                    [](const TargetDevice &drive) { return drive.isSystem; }),
                     drives.end());
    }

    ILOG_DEBUG(QStringLiteral("DriveList"),
               QStringLiteral("listDrives"),
               QStringLiteral("drives_enumerated"),
               QStringLiteral("target_selection"),
               QStringLiteral("lsblk"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"count", drives.size()}, {"includeSystem", includeSystem}}));
    return drives;
}

} // namespace imprint
