#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace imprint {

struct ImageDescriptor {
    std::string name;
    std::string url;
    std::optional<std::uint64_t> expectedSize;
    std::optional<std::string> expectedSha256;
};

struct TargetDevice {
    std::string path;
    std::string description;
    std::uint64_t size = 0;
    bool isRemovable = false;
    bool isReadonly = false;
    // Carries the root filesystem; the front-end must never offer it.
    bool isSystem = false;
    std::vector<std::string> mountpoints;
};

struct ProvisioningSettings {
    std::string hostname = "raspberrypi";
    std::string timezone = "Europe/London";
    std::string keyboardLayout = "gb";
    std::string locale = "en_GB.UTF-8";

    std::string userName = "pi";
    // Plaintext; only its crypt hash ever reaches the boot volume.
    std::optional<std::string> password;

    bool sshEnabled = false;
    bool sshPasswordAuth = true;
    std::string sshPublicKeys;

    std::string wifiSsid;
    std::string wifiPassword;
    std::string wifiCountry = "GB";
    bool wifiHidden = false;

    // Passthrough flags, no effect on the first-boot script.
    bool telemetry = true;
    bool ejectOnFinish = true;
};

struct TransferEvent {
    TransferEventKind kind = TransferEventKind::Status;
    double percent = 0.0;
    TransferPhase phase = TransferPhase::Writing;
    std::string message;

    static TransferEvent progress(double value)
    {
        TransferEvent event;
        event.kind = TransferEventKind::Progress;
        event.percent = value;
        return event;
    }

    static TransferEvent verifyProgress(double value)
    {
        TransferEvent event;
        event.kind = TransferEventKind::VerifyProgress;
        event.percent = value;
        return event;
    }

    static TransferEvent phaseChange(TransferPhase value)
    {
        TransferEvent event;
        event.kind = TransferEventKind::Phase;
        event.phase = value;
        return event;
    }

    static TransferEvent status(std::string text)
    {
        TransferEvent event;
        event.kind = TransferEventKind::Status;
        event.message = std::move(text);
        return event;
    }

    static TransferEvent error(std::string text)
    {
        TransferEvent event;
        event.kind = TransferEventKind::Error;
        event.message = std::move(text);
        return event;
    }

    static TransferEvent finished()
    {
        TransferEvent event;
        event.kind = TransferEventKind::Finished;
        return event;
    }

    bool isTerminal() const
    {
        return kind == TransferEventKind::Error || kind == TransferEventKind::Finished;
    }

    bool operator==(const TransferEvent &other) const
    {
        return kind == other.kind && percent == other.percent
            && phase == other.phase && message == other.message;
    }
};

// Catalog document entities.
struct CatalogDevice {
    std::string name;
    std::string description;
    std::vector<std::string> tags;
    bool isDefault = false;
};

struct CatalogEntry {
    std::string name;
    std::string description;
    std::optional<std::string> url;
    std::optional<std::uint64_t> extractSize;
    std::optional<std::string> extractSha256;
    std::optional<std::uint64_t> imageDownloadSize;
    std::optional<std::string> releaseDate;
    std::vector<std::string> devices;
    std::vector<CatalogEntry> subitems;
};

struct Catalog {
    std::string latestVersion;
    std::vector<CatalogDevice> devices;
    std::vector<CatalogEntry> entries;
};

} // namespace imprint
