#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "common/models.hpp"

namespace imprint {

class BlockDevice;

struct TransferSummary {
    std::uint64_t bytesWritten = 0;
    // Lowercase hex SHA-256 of the decoded image bytes.
    std::string sourceSha256;
};

using TransferEventSink = std::function<void(const TransferEvent &)>;
using DeviceOpener = std::function<std::unique_ptr<BlockDevice>(const std::string &path)>;

/**
 * Streams one image onto one device and proves the write.
 *
 * transfer() downloads (or reads) the image, decodes it by extension, writes
 * it to the device in 4 MiB chunks while hashing, syncs, checks the source
 * hash against the catalog hash and finally re-reads the written range to
 * compare the on-disk hash with the source hash.
 *
 * Events go to the sink in protocol order. The engine never emits the
 * terminal event itself: it returns a summary or throws ImprintError and
 * leaves Finished/Error to the caller.
 */
class TransferEngine {
public:
    explicit TransferEngine(TransferEventSink sink);

    void setProgressInterval(std::chrono::milliseconds interval);
    void setChunkSize(std::size_t bytes);

    // Replaces how the target node is opened. Defaults to a plain BlockDevice.
    void setDeviceOpener(DeviceOpener opener);

    TransferSummary transfer(const ImageDescriptor &image, const TargetDevice &device);

private:
    void emitEvent(const TransferEvent &event) const;

    TransferEventSink m_sink;
    DeviceOpener m_openDevice;
    std::chrono::milliseconds m_progressInterval{500};
    std::size_t m_chunkSize = 4 * 1024 * 1024;
};

} // namespace imprint
