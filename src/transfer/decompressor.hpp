#pragma once

#include <memory>
#include <string>

#include "common/enums.hpp"
#include "transfer/image_source.hpp"

namespace imprint {

/**
 * Pick the decoder from the file extension of a source path.
 *
 * - ".xz", ".gz", ".zst" select the matching stream decoder.
 * - ".zip" is reported as CompressionFormat::Zip so the caller can reject it.
 * - Anything else is treated as a raw image.
 */
CompressionFormat detectCompression(const std::string &path);

// Throws ImprintError(SourceUnavailable) for formats that cannot be streamed.
void ensureSupported(CompressionFormat format);

/**
 * Wrap an upstream byte source in a streaming decoder.
 *
 * The returned source yields decompressed bytes. Corrupt or truncated input
 * throws ImprintError(SourceUnavailable) from read(). For
 * CompressionFormat::None the upstream is returned unchanged.
 */
std::unique_ptr<ImageSource> makeDecompressor(CompressionFormat format,
                                              std::unique_ptr<ImageSource> upstream);

} // namespace imprint
