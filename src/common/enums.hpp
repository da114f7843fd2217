#pragma once

namespace imprint {

enum class TransferPhase {
    Writing,
    Verifying
};

// Closed set of worker-to-supervisor message kinds.
enum class TransferEventKind {
    Progress,
    VerifyProgress,
    Phase,
    Status,
    Error,
    Finished
};

enum class CompressionFormat {
    None,
    Xz,
    Gzip,
    Zstd,
    Zip
};

enum class ErrorKind {
    SourceUnavailable,
    DeviceUnavailable,
    IntegrityError,
    WriteVerificationError,
    InstallError,
    ProtocolError,
    CatalogError,
    ElevationFailed
};

} // namespace imprint
