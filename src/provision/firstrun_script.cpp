#include "provision/firstrun_script.hpp"

#include <memory>
#include <sstream>

#include <crypt.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace imprint {

namespace {

const char *const kCustomHelper = "/usr/lib/raspberrypi-sys-mods/imager_custom";
const char *const kUserconfHelper = "/usr/lib/userconf-pi/userconf";
const char *const kDefaultLocale = "en_GB.UTF-8";

// Value placed between single quotes: close, emit an escaped quote, reopen.
std::string singleQuoteEscape(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    return out;
}

std::string quoted(const std::string &value)
{
    return "\"" + shellEscape(value) + "\"";
}

std::string randomSalt()
{
    char setting[CRYPT_GENSALT_OUTPUT_SIZE];
    // A null random-bytes pointer lets libxcrypt draw from the OS RNG.
    if (!crypt_gensalt_rn("$6$", 0, nullptr, 0, setting, sizeof(setting))) {
        return std::string();
    }
    return setting;
}

void appendHostname(std::ostringstream &script, const ProvisioningSettings &settings)
{
    const std::string hostsReplacement = shellEscape(sedReplacementEscape(settings.hostname));

    script << "CURRENT_HOSTNAME=$(cat /etc/hostname | tr -d \" \\t\\n\\r\")\n"
           << "if [ -f " << kCustomHelper << " ]; then\n"
           << "   " << kCustomHelper << " set_hostname " << quoted(settings.hostname) << "\n"
           << "else\n"
           << "   echo " << quoted(settings.hostname) << " >/etc/hostname\n"
           << "   sed -i \"s/127.0.1.1.*$CURRENT_HOSTNAME/127.0.1.1\\t" << hostsReplacement
           << "/g\" /etc/hosts\n"
           << "fi\n";
}

void appendSsh(std::ostringstream &script, const ProvisioningSettings &settings)
{
    if (!settings.sshPublicKeys.empty()) {
        script << "if [ -f " << kCustomHelper << " ]; then\n"
               << "   " << kCustomHelper << " enable_ssh -k '"
               << singleQuoteEscape(settings.sshPublicKeys) << "'\n"
               << "else\n"
               << "   install -o \"$FIRSTUSER\" -m 700 -d \"$FIRSTUSERHOME/.ssh\"\n"
               << "   cat > \"$FIRSTUSERHOME/.ssh/authorized_keys\" <<'EOF'\n"
               << settings.sshPublicKeys << "\n"
               << "EOF\n"
               << "   chown \"$FIRSTUSER:$FIRSTUSER\" \"$FIRSTUSERHOME/.ssh/authorized_keys\"\n"
               << "   chmod 600 \"$FIRSTUSERHOME/.ssh/authorized_keys\"\n";
        if (!settings.sshPasswordAuth) {
            script << "   echo 'PasswordAuthentication no' >>/etc/ssh/sshd_config\n";
        }
        script << "   systemctl enable ssh\n"
               << "fi\n";
    } else if (settings.sshPasswordAuth) {
        script << "if [ -f " << kCustomHelper << " ]; then\n"
               << "   " << kCustomHelper << " enable_ssh\n"
               << "else\n"
               << "   systemctl enable ssh\n"
               << "fi\n";
    }
}

void appendUser(std::ostringstream &script,
                const ProvisioningSettings &settings,
                const std::string &passwordHash)
{
    const std::string user = shellEscape(settings.userName);
    const std::string userReplacement = shellEscape(sedReplacementEscape(settings.userName));

    script << "if [ -f " << kUserconfHelper << " ]; then\n"
           << "   " << kUserconfHelper << " " << quoted(settings.userName) << " "
           << quoted(passwordHash) << "\n"
           << "else\n"
           << "   echo \"$FIRSTUSER:" << shellEscape(passwordHash) << "\" | chpasswd -e\n"
           << "   if [ \"$FIRSTUSER\" != \"" << user << "\" ]; then\n"
           << "      usermod -l \"" << user << "\" \"$FIRSTUSER\"\n"
           << "      usermod -m -d \"/home/" << user << "\" \"" << user << "\"\n"
           << "      groupmod -n \"" << user << "\" \"$FIRSTUSER\"\n"
           << "      if grep -q \"^autologin-user=\" /etc/lightdm/lightdm.conf ; then\n"
           << "         sed /etc/lightdm/lightdm.conf -i -e \"s/^autologin-user=.*/autologin-user="
           << userReplacement << "/\"\n"
           << "      fi\n"
           << "      if [ -f /etc/systemd/system/getty@tty1.service.d/autologin.conf ]; then\n"
           << "         sed /etc/systemd/system/getty@tty1.service.d/autologin.conf -i -e \"s/$FIRSTUSER/"
           << userReplacement << "/\"\n"
           << "      fi\n"
           << "      if [ -f /etc/sudoers.d/010_pi-nopasswd ]; then\n"
           << "         sed -i \"s/^$FIRSTUSER /" << userReplacement
           << " /\" /etc/sudoers.d/010_pi-nopasswd\n"
           << "      fi\n"
           << "   fi\n"
           << "fi\n";
}

void appendWifi(std::ostringstream &script, const ProvisioningSettings &settings)
{
    script << "if [ -f " << kCustomHelper << " ]; then\n"
           << "   " << kCustomHelper << " set_wlan ";
    if (settings.wifiHidden) {
        script << "-h ";
    }
    script << quoted(settings.wifiSsid) << " " << quoted(settings.wifiPassword) << " "
           << quoted(settings.wifiCountry) << "\n"
           << "else\n"
           << "cat >/etc/wpa_supplicant/wpa_supplicant.conf <<'WPAEOF'\n";
    if (!settings.wifiCountry.empty()) {
        script << "country=" << settings.wifiCountry << "\n";
    }
    script << "ctrl_interface=DIR=/var/run/wpa_supplicant GROUP=netdev\n"
           << "update_config=1\n"
           << "network={\n"
           << "    ssid=\"" << settings.wifiSsid << "\"\n"
           << "    psk=\"" << settings.wifiPassword << "\"\n";
    if (settings.wifiHidden) {
        script << "    scan_ssid=1\n";
    }
    script << "}\n"
           << "WPAEOF\n"
           << "   chmod 600 /etc/wpa_supplicant/wpa_supplicant.conf\n"
           << "   rfkill unblock wifi || true\n"
           << "   for filename in /var/lib/systemd/rfkill/*:wlan ; do\n"
           << "       echo 0 > $filename\n"
           << "   done\n"
           << "fi\n";
}

void appendRegional(std::ostringstream &script, const ProvisioningSettings &settings)
{
    if (!settings.keyboardLayout.empty() || !settings.timezone.empty()) {
        script << "if [ -f " << kCustomHelper << " ]; then\n";
        if (!settings.keyboardLayout.empty()) {
            script << "   " << kCustomHelper << " set_keymap "
                   << quoted(settings.keyboardLayout) << "\n";
        }
        if (!settings.timezone.empty()) {
            script << "   " << kCustomHelper << " set_timezone "
                   << quoted(settings.timezone) << "\n";
        }
        script << "else\n";
        if (!settings.timezone.empty()) {
            script << "   rm -f /etc/localtime\n"
                   << "   echo " << quoted(settings.timezone) << " >/etc/timezone\n"
                   << "   dpkg-reconfigure -f noninteractive tzdata\n";
        }
        if (!settings.keyboardLayout.empty()) {
            script << "cat >/etc/default/keyboard <<'KBEOF'\n"
                   << "XKBMODEL=\"pc105\"\n"
                   << "XKBLAYOUT=\"" << settings.keyboardLayout << "\"\n"
                   << "XKBVARIANT=\"\"\n"
                   << "XKBOPTIONS=\"\"\n"
                   << "\n"
                   << "KBEOF\n"
                   << "   dpkg-reconfigure -f noninteractive keyboard-configuration\n";
        }
        script << "fi\n";
    }

    // The stock image already generates en_GB.UTF-8.
    if (!settings.locale.empty() && settings.locale != kDefaultLocale) {
        script << "sed -i 's/^# *"
               << singleQuoteEscape(regexEscape(settings.locale)) << " /"
               << singleQuoteEscape(sedReplacementEscape(settings.locale))
               << " /' /etc/locale.gen\n"
               << "locale-gen\n"
               << "update-locale LANG=" << quoted(settings.locale) << "\n";
    }
}

} // namespace

std::string shellEscape(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '\\':
        case '"':
        case '$':
        case '`':
            out += '\\';
            out += c;
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string sedReplacementEscape(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '&' || c == '/') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string regexEscape(const std::string &value)
{
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
        case '.':
        case '[':
        case ']':
        case '*':
        case '^':
        case '$':
        case '\\':
        case '/':
            out += '\\';
            out += c;
            break;
        default:
            out += c;
            break;
        }
    }
    return out;
}

std::string hashPassword(const std::string &password, const std::string &salt)
{
    const std::string setting = salt.empty() ? randomSalt() : salt;
    if (setting.empty()) {
        return std::string();
    }

    auto data = std::make_unique<crypt_data>();
    const char *hashed = crypt_r(password.c_str(), setting.c_str(), data.get());
    // libxcrypt signals failure with a null pointer or a "*"-prefixed token.
    if (!hashed || hashed[0] == '*') {
        return std::string();
    }
    return hashed;
}

std::string synthesizeFirstRunScript(const ProvisioningSettings &settings,
                                     const std::string &passwordSalt)
{
    std::ostringstream script;
    script << "#!/bin/bash\n";
    // Individual steps may fail harmlessly on images without the helpers.
    script << "set +e\n";

    if (!settings.hostname.empty()) {
        appendHostname(script, settings);
    }

    std::string passwordHash;
    const bool wantsUser = !settings.userName.empty()
        && settings.password.has_value() && !settings.password->empty();
    if (wantsUser) {
        passwordHash = hashPassword(*settings.password, passwordSalt);
        if (passwordHash.empty()) {
            ILOG_WARN(QStringLiteral("FirstRunScript"),
                      QStringLiteral("synthesizeFirstRunScript"),
                      QStringLiteral("password_hash_failed"),
                      QStringLiteral("crypt_rejected_setting"),
                      QStringLiteral("skip_user_block"),
                      logging::defaultWho(),
                      logging::currentCorrelationId(),
                      (nlohmann::json{{"user", settings.userName}}));
        }
    }
    const bool emitUser = wantsUser && !passwordHash.empty();

    if (settings.sshEnabled || emitUser) {
        script << "FIRSTUSER=$(getent passwd 1000 | cut -d: -f1)\n"
               << "FIRSTUSERHOME=$(getent passwd 1000 | cut -d: -f6)\n";
    }

    if (settings.sshEnabled) {
        appendSsh(script, settings);
    }

    if (emitUser) {
        appendUser(script, settings, passwordHash);
    }

    if (!settings.wifiSsid.empty()) {
        appendWifi(script, settings);
    }

    appendRegional(script, settings);

    script << "rm -f /boot/firstrun.sh\n"
           << "sed -i 's| systemd.run.*||g' /boot/cmdline.txt\n"
           << "exit 0\n";

    return script.str();
}

} // namespace imprint
