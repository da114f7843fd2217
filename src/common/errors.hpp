#pragma once

#include <stdexcept>
#include <string>

#include "common/enums.hpp"

namespace imprint {

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::SourceUnavailable:
        return "SourceUnavailable";
    case ErrorKind::DeviceUnavailable:
        return "DeviceUnavailable";
    case ErrorKind::IntegrityError:
        return "IntegrityError";
    case ErrorKind::WriteVerificationError:
        return "WriteVerificationError";
    case ErrorKind::InstallError:
        return "InstallError";
    case ErrorKind::ProtocolError:
        return "ProtocolError";
    case ErrorKind::CatalogError:
        return "CatalogError";
    case ErrorKind::ElevationFailed:
        return "ElevationFailed";
    }
    return "Unknown";
}

// Every failure the transfer, provisioning and protocol layers report.
// what() is the user-facing message and is relayed verbatim.
class ImprintError : public std::runtime_error {
public:
    ImprintError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

} // namespace imprint
