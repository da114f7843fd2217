#pragma once

#include <string>

#include "common/models.hpp"

namespace imprint {

/**
 * Build the first-boot provisioning script for a freshly written image.
 *
 * The script configures hostname, SSH, the primary user, Wi-Fi, timezone,
 * keyboard and locale, then deletes itself and strips the one-shot boot
 * arguments from cmdline.txt. Each block prefers the distro helpers under
 * /usr/lib/raspberrypi-sys-mods and /usr/lib/userconf-pi and falls back to
 * editing system files directly.
 *
 * - passwordSalt: crypt(3) setting such as "$6$abcdefgh". Empty means a
 *   fresh random SHA-512 salt; pass a fixed salt for reproducible output.
 *
 * The plaintext password never appears in the result.
 */
std::string synthesizeFirstRunScript(const ProvisioningSettings &settings,
                                     const std::string &passwordSalt = std::string());

// SHA-512 crypt(3) hash ("$6$..."). Returns an empty string if the system
// crypt library rejects the salt or the algorithm.
std::string hashPassword(const std::string &password, const std::string &salt = std::string());

// Escaping for values spliced into a double-quoted shell word.
std::string shellEscape(const std::string &value);

// Escaping for the right-hand side of a sed s/// replacement.
std::string sedReplacementEscape(const std::string &value);

// Escaping for a literal used as a basic regular expression.
std::string regexEscape(const std::string &value);

} // namespace imprint
