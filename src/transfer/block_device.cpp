#include "transfer/block_device.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include "common/errors.hpp"

namespace imprint {

BlockDevice::BlockDevice(const std::string &path)
    : m_path(path)
{
    m_fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC);
    if (m_fd < 0) {
        const int err = errno;
        throw ImprintError(ErrorKind::DeviceUnavailable,
                           "Failed to open device " + path
                               + ". Ensure you are running with root privileges (sudo). ("
                               + std::strerror(err) + ")");
    }
}

BlockDevice::~BlockDevice()
{
    if (m_fd >= 0) {
        ::close(m_fd);
    }
}

void BlockDevice::writeAll(const char *data, qint64 size)
{
    qint64 offset = 0;
    while (offset < size) {
        const ssize_t n = ::write(m_fd, data + offset, static_cast<size_t>(size - offset));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(ErrorKind::DeviceUnavailable, "Failed to write to storage device");
        }
        if (n == 0) {
            // No space left on the device is reported as a short write.
            throw ImprintError(ErrorKind::DeviceUnavailable,
                               "Failed to write to storage device " + m_path
                                   + ": device is full");
        }
        offset += n;
    }
}

void BlockDevice::sync()
{
    if (::fsync(m_fd) != 0) {
        fail(ErrorKind::DeviceUnavailable, "Failed to sync data to device");
    }
    // Advisory; verification still works if the kernel keeps the pages.
    ::posix_fadvise(m_fd, 0, 0, POSIX_FADV_DONTNEED);
}

void BlockDevice::rewind()
{
    if (::lseek(m_fd, 0, SEEK_SET) == static_cast<off_t>(-1)) {
        fail(ErrorKind::DeviceUnavailable, "Failed to seek to start of device for verification");
    }
}

qint64 BlockDevice::read(char *buffer, qint64 maxSize)
{
    while (true) {
        const ssize_t n = ::read(m_fd, buffer, static_cast<size_t>(maxSize));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            fail(ErrorKind::WriteVerificationError,
                 "Failed to read from device for verification");
        }
        return n;
    }
}

void BlockDevice::fail(ErrorKind kind, const std::string &action) const
{
    const int err = errno;
    throw ImprintError(kind,
                       action + " " + m_path + ": " + std::strerror(err));
}

} // namespace imprint
