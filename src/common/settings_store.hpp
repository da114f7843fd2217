#pragma once

#include <string>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace imprint {

// SettingsStore persists the user's provisioning choices as JSON under the
// per-user config directory. Loading never fails: a missing or unreadable
// file yields the built-in defaults.
class SettingsStore {
public:
    SettingsStore();
    explicit SettingsStore(const QString &path);

    ProvisioningSettings load() const;
    bool save(const ProvisioningSettings &settings) const;

    QString path() const;
    static QString defaultPath();

private:
    QString m_path;
};

// True when any field that changes the first-boot script differs from the
// defaults. The passthrough flags are ignored.
bool needsCustomization(const ProvisioningSettings &settings);

// Applies "key=value" style edits from the command line. Keys use the
// persisted JSON names (hostname, user_name, ssh_enabled, ...).
bool applySetting(ProvisioningSettings &settings,
                  const std::string &key,
                  const std::string &value,
                  std::string *error);

// Public keys under homeDir/.ssh: every *.pub file plus non-comment lines of
// authorized_keys, trimmed, sorted and de-duplicated.
std::vector<std::string> discoverSshKeys(const QString &homeDir);

} // namespace imprint
