#include "common/settings_store.hpp"

#include <algorithm>
#include <cctype>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/process_utils.hpp"

namespace imprint {

namespace {

bool parseBool(const std::string &value, bool *out)
{
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        *out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        *out = false;
        return true;
    }
    return false;
}

} // namespace

SettingsStore::SettingsStore()
    : m_path(defaultPath())
{
}

SettingsStore::SettingsStore(const QString &path)
    : m_path(path)
{
}

QString SettingsStore::defaultPath()
{
    const QString dir = configDirPath();
    if (dir.isEmpty()) {
        return QString();
    }
    return dir + QStringLiteral("/config.json");
}

QString SettingsStore::path() const
{
    return m_path;
}

ProvisioningSettings SettingsStore::load() const
{
    if (m_path.isEmpty()) {
        return ProvisioningSettings();
    }

    QFile file(m_path);
    if (!file.exists() || !file.open(QIODevice::ReadOnly)) {
        return ProvisioningSettings();
    }

    const QByteArray data = file.readAll();
    try {
        const auto parsed = nlohmann::json::parse(data.toStdString());
        if (!parsed.is_object()) {
            return ProvisioningSettings();
        }
        return parsed.get<ProvisioningSettings>();
    } catch (const nlohmann::json::exception &ex) {
        ILOG_WARN(QStringLiteral("SettingsStore"),
                  QStringLiteral("load"),
                  QStringLiteral("settings_corrupt"),
                  QString::fromUtf8(ex.what()),
                  QStringLiteral("fallback_defaults"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"path", m_path.toStdString()}}));
        return ProvisioningSettings();
    }
}

bool SettingsStore::save(const ProvisioningSettings &settings) const
{
    if (m_path.isEmpty()) {
        return false;
    }

    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        return false;
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(nlohmann::json(settings).dump(2));
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        return false;
    }
    // The file may hold a plaintext password.
    file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    return file.commit();
}

bool needsCustomization(const ProvisioningSettings &settings)
{
    const ProvisioningSettings defaults;
    return settings.hostname != defaults.hostname
        || settings.sshEnabled
        || !settings.wifiSsid.empty()
        || settings.userName != defaults.userName
        || settings.password.has_value()
        || settings.timezone != defaults.timezone
        || settings.keyboardLayout != defaults.keyboardLayout
        || settings.locale != defaults.locale;
}

bool applySetting(ProvisioningSettings &settings,
                  const std::string &key,
                  const std::string &value,
                  std::string *error)
{
    auto setBool = [&](bool &field) {
        if (!parseBool(value, &field)) {
            if (error) {
                *error = "Expected a boolean for " + key + ", got '" + value + "'";
            }
            return false;
        }
        return true;
    };

    if (key == "hostname") {
        settings.hostname = value;
    } else if (key == "timezone") {
        settings.timezone = value;
    } else if (key == "keyboard_layout") {
        settings.keyboardLayout = value;
    } else if (key == "locale") {
        settings.locale = value;
    } else if (key == "user_name") {
        settings.userName = value;
    } else if (key == "password") {
        if (value.empty()) {
            settings.password.reset();
        } else {
            settings.password = value;
        }
    } else if (key == "ssh_enabled") {
        return setBool(settings.sshEnabled);
    } else if (key == "ssh_password_auth") {
        return setBool(settings.sshPasswordAuth);
    } else if (key == "ssh_public_keys") {
        settings.sshPublicKeys = value;
    } else if (key == "wifi_ssid") {
        settings.wifiSsid = value;
    } else if (key == "wifi_password") {
        settings.wifiPassword = value;
    } else if (key == "wifi_country") {
        settings.wifiCountry = value;
    } else if (key == "wifi_hidden") {
        return setBool(settings.wifiHidden);
    } else if (key == "telemetry") {
        return setBool(settings.telemetry);
    } else if (key == "eject_finished") {
        return setBool(settings.ejectOnFinish);
    } else {
        if (error) {
            *error = "Unknown setting: " + key;
        }
        return false;
    }
    return true;
}

std::vector<std::string> discoverSshKeys(const QString &homeDir)
{
    std::vector<std::string> keys;
    const QDir sshDir(homeDir + QStringLiteral("/.ssh"));
    if (!sshDir.exists()) {
        return keys;
    }

    const QFileInfoList pubFiles = sshDir.entryInfoList(
        {QStringLiteral("*.pub")}, QDir::Files | QDir::Readable);
    for (const QFileInfo &entry : pubFiles) {
        QFile file(entry.absoluteFilePath());
        if (!file.open(QIODevice::ReadOnly)) {
            continue;
        }
        const QString content = QString::fromUtf8(file.readAll()).trimmed();
        if (!content.isEmpty()) {
            keys.push_back(content.toStdString());
        }
    }

    QFile authorized(sshDir.filePath(QStringLiteral("authorized_keys")));
    if (authorized.open(QIODevice::ReadOnly | QIODevice::Text)) {
        while (!authorized.atEnd()) {
            const QString line = QString::fromUtf8(authorized.readLine()).trimmed();
            if (line.isEmpty() || line.startsWith(QLatin1Char('#'))) {
                continue;
            }
            keys.push_back(line.toStdString());
        }
    }

    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    return keys;
}

} // namespace imprint
