#pragma once

#include <string>

#include <QtGlobal>

#include "common/enums.hpp"

namespace imprint {

// Exclusive read/write handle on the target device node (or a regular file
// standing in for one). Closes the descriptor on destruction.
class BlockDevice {
public:
    // Throws ImprintError(DeviceUnavailable) if the node cannot be opened.
    explicit BlockDevice(const std::string &path);
    virtual ~BlockDevice();

    BlockDevice(const BlockDevice &) = delete;
    BlockDevice &operator=(const BlockDevice &) = delete;

    void writeAll(const char *data, qint64 size);

    // fsync, then drop the cached pages so a later read hits the medium.
    void sync();

    void rewind();

    // Read-back for verification. Returns 0 at end of device; a failing
    // read throws ImprintError(WriteVerificationError).
    virtual qint64 read(char *buffer, qint64 maxSize);

    const std::string &path() const { return m_path; }

private:
    [[noreturn]] void fail(ErrorKind kind, const std::string &action) const;

    std::string m_path;
    int m_fd = -1;
};

} // namespace imprint
