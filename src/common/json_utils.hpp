#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace imprint {

inline std::string toPhaseString(TransferPhase phase)
{
    switch (phase) {
    case TransferPhase::Writing:
        return "Writing";
    case TransferPhase::Verifying:
        return "Verifying";
    }
    return "Writing";
}

inline std::optional<TransferPhase> parsePhaseString(const std::string &value)
{
    if (value == "Writing") {
        return TransferPhase::Writing;
    }
    if (value == "Verifying") {
        return TransferPhase::Verifying;
    }
    return std::nullopt;
}

inline std::string toEventKindString(TransferEventKind kind)
{
    switch (kind) {
    case TransferEventKind::Progress:
        return "Progress";
    case TransferEventKind::VerifyProgress:
        return "VerifyProgress";
    case TransferEventKind::Phase:
        return "Phase";
    case TransferEventKind::Status:
        return "Status";
    case TransferEventKind::Error:
        return "Error";
    case TransferEventKind::Finished:
        return "Finished";
    }
    return "Status";
}

inline std::optional<TransferEventKind> parseEventKindString(const std::string &value)
{
    if (value == "Progress") {
        return TransferEventKind::Progress;
    }
    if (value == "VerifyProgress") {
        return TransferEventKind::VerifyProgress;
    }
    if (value == "Phase") {
        return TransferEventKind::Phase;
    }
    if (value == "Status") {
        return TransferEventKind::Status;
    }
    if (value == "Error") {
        return TransferEventKind::Error;
    }
    if (value == "Finished") {
        return TransferEventKind::Finished;
    }
    return std::nullopt;
}

inline void to_json(nlohmann::json &j, const ProvisioningSettings &settings)
{
    j = nlohmann::json{
        {"hostname", settings.hostname},
        {"timezone", settings.timezone},
        {"keyboard_layout", settings.keyboardLayout},
        {"locale", settings.locale},
        {"user_name", settings.userName},
        {"password", settings.password ? nlohmann::json(*settings.password) : nlohmann::json()},
        {"ssh_enabled", settings.sshEnabled},
        {"ssh_password_auth", settings.sshPasswordAuth},
        {"ssh_public_keys", settings.sshPublicKeys},
        {"wifi_ssid", settings.wifiSsid},
        {"wifi_password", settings.wifiPassword},
        {"wifi_country", settings.wifiCountry},
        {"wifi_hidden", settings.wifiHidden},
        {"telemetry", settings.telemetry},
        {"eject_finished", settings.ejectOnFinish}
    };
}

// Missing keys keep their defaults; a present key of the wrong type throws
// nlohmann::json::type_error.
inline void from_json(const nlohmann::json &j, ProvisioningSettings &settings)
{
    const ProvisioningSettings defaults;
    settings.hostname = j.value("hostname", defaults.hostname);
    settings.timezone = j.value("timezone", defaults.timezone);
    settings.keyboardLayout = j.value("keyboard_layout", defaults.keyboardLayout);
    settings.locale = j.value("locale", defaults.locale);
    settings.userName = j.value("user_name", defaults.userName);
    if (j.contains("password") && j.at("password").is_string()) {
        settings.password = j.at("password").get<std::string>();
    } else {
        settings.password.reset();
    }
    settings.sshEnabled = j.value("ssh_enabled", defaults.sshEnabled);
    settings.sshPasswordAuth = j.value("ssh_password_auth", defaults.sshPasswordAuth);
    settings.sshPublicKeys = j.value("ssh_public_keys", defaults.sshPublicKeys);
    settings.wifiSsid = j.value("wifi_ssid", defaults.wifiSsid);
    settings.wifiPassword = j.value("wifi_password", defaults.wifiPassword);
    settings.wifiCountry = j.value("wifi_country", defaults.wifiCountry);
    settings.wifiHidden = j.value("wifi_hidden", defaults.wifiHidden);
    settings.telemetry = j.value("telemetry", defaults.telemetry);
    settings.ejectOnFinish = j.value("eject_finished", defaults.ejectOnFinish);
}

inline void to_json(nlohmann::json &j, const TransferEvent &event)
{
    j = nlohmann::json{{"type", toEventKindString(event.kind)}};
    switch (event.kind) {
    case TransferEventKind::Progress:
    case TransferEventKind::VerifyProgress:
        j["data"] = event.percent;
        break;
    case TransferEventKind::Phase:
        j["data"] = toPhaseString(event.phase);
        break;
    case TransferEventKind::Status:
    case TransferEventKind::Error:
        j["data"] = event.message;
        break;
    case TransferEventKind::Finished:
        break;
    }
}

// Strict: unknown kinds or payloads of the wrong shape throw a
// ProtocolError so the reader can drop the record.
inline void from_json(const nlohmann::json &j, TransferEvent &event)
{
    if (!j.is_object() || !j.contains("type") || !j.at("type").is_string()) {
        throw ImprintError(ErrorKind::ProtocolError, "event record without type");
    }
    const auto kind = parseEventKindString(j.at("type").get<std::string>());
    if (!kind) {
        throw ImprintError(ErrorKind::ProtocolError, "unknown event type");
    }

    event = TransferEvent();
    event.kind = *kind;
    const auto data = j.find("data");
    switch (*kind) {
    case TransferEventKind::Progress:
    case TransferEventKind::VerifyProgress:
        if (data == j.end() || !data->is_number()) {
            throw ImprintError(ErrorKind::ProtocolError, "progress without number");
        }
        event.percent = data->get<double>();
        break;
    case TransferEventKind::Phase: {
        if (data == j.end() || !data->is_string()) {
            throw ImprintError(ErrorKind::ProtocolError, "phase without name");
        }
        const auto phase = parsePhaseString(data->get<std::string>());
        if (!phase) {
            throw ImprintError(ErrorKind::ProtocolError, "unknown phase");
        }
        event.phase = *phase;
        break;
    }
    case TransferEventKind::Status:
    case TransferEventKind::Error:
        if (data == j.end() || !data->is_string()) {
            throw ImprintError(ErrorKind::ProtocolError, "message without text");
        }
        event.message = data->get<std::string>();
        break;
    case TransferEventKind::Finished:
        break;
    }
}

inline void to_json(nlohmann::json &j, const TargetDevice &device)
{
    j = nlohmann::json{
        {"path", device.path},
        {"description", device.description},
        {"size", device.size},
        {"removable", device.isRemovable},
        {"readonly", device.isReadonly},
        {"system", device.isSystem},
        {"mountpoints", device.mountpoints}
    };
}

namespace detail {

inline std::optional<std::uint64_t> optionalSize(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    // Negative integers parse as signed and are rejected rather than wrapped.
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    return std::nullopt;
}

inline std::optional<std::string> optionalString(const nlohmann::json &j, const char *key)
{
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

inline std::vector<std::string> stringList(const nlohmann::json &j, const char *key)
{
    std::vector<std::string> values;
    const auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto &item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

} // namespace detail

inline void from_json(const nlohmann::json &j, CatalogDevice &device)
{
    device.name = j.at("name").get<std::string>();
    device.description = j.value("description", "");
    device.tags = detail::stringList(j, "tags");
    device.isDefault = j.value("default", false);
}

inline void to_json(nlohmann::json &j, const CatalogDevice &device)
{
    j = nlohmann::json{
        {"name", device.name},
        {"description", device.description},
        {"tags", device.tags},
        {"default", device.isDefault}
    };
}

inline void from_json(const nlohmann::json &j, CatalogEntry &entry)
{
    entry.name = j.at("name").get<std::string>();
    entry.description = j.value("description", "");
    entry.url = detail::optionalString(j, "url");
    entry.extractSize = detail::optionalSize(j, "extract_size");
    entry.extractSha256 = detail::optionalString(j, "extract_sha256");
    entry.imageDownloadSize = detail::optionalSize(j, "image_download_size");
    entry.releaseDate = detail::optionalString(j, "release_date");
    entry.devices = detail::stringList(j, "devices");
    entry.subitems.clear();
    if (j.contains("subitems") && j.at("subitems").is_array()) {
        entry.subitems = j.at("subitems").get<std::vector<CatalogEntry>>();
    }
}

inline void to_json(nlohmann::json &j, const CatalogEntry &entry)
{
    j = nlohmann::json{
        {"name", entry.name},
        {"description", entry.description},
        {"devices", entry.devices},
        {"subitems", entry.subitems}
    };
    if (entry.url) {
        j["url"] = *entry.url;
    }
    if (entry.extractSize) {
        j["extract_size"] = *entry.extractSize;
    }
    if (entry.extractSha256) {
        j["extract_sha256"] = *entry.extractSha256;
    }
    if (entry.imageDownloadSize) {
        j["image_download_size"] = *entry.imageDownloadSize;
    }
    if (entry.releaseDate) {
        j["release_date"] = *entry.releaseDate;
    }
}

} // namespace imprint
