#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <QStringList>

#include "common/models.hpp"

namespace imprint {

/**
 * Everything the elevated worker needs for one write attempt, carried on
 * its command line:
 *
 *   --worker --device <path> --image <url> [--size <n>] [--sha256 <hex>]
 *   [--options <base64 json settings>] [--corr <id>] [--trace]
 */
struct WorkerInvocation {
    std::string devicePath;
    std::string imageUrl;
    std::optional<std::uint64_t> expectedSize;
    std::optional<std::string> expectedSha256;
    ProvisioningSettings settings;
    std::string correlationId;
    bool trace = false;

    // Arguments after the program name, starting with "--worker".
    QStringList toArguments() const;

    // Throws ImprintError(ProtocolError) when the device or image is
    // missing, the size is not a decimal number, or the options blob is
    // not base64-encoded settings JSON. Unknown flags are ignored.
    static WorkerInvocation fromArguments(const QStringList &args);

    ImageDescriptor image() const;
    TargetDevice device() const;
};

} // namespace imprint
