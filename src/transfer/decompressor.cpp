#include "transfer/decompressor.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdint>
#include <vector>

#include <lzma.h>
#include <zlib.h>
#include <zstd.h>

#include "common/errors.hpp"

namespace imprint {

namespace {

constexpr qint64 kInputBufferBytes = 1024 * 1024;

bool endsWith(const std::string &value, const std::string &suffix)
{
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

[[noreturn]] void throwDecodeError(const std::string &detail)
{
    throw ImprintError(ErrorKind::SourceUnavailable,
                       "Failed to read/decompress image stream: " + detail);
}

// Shared input side of the stream decoders: a fixed buffer refilled from the
// upstream source on demand.
class DecoderSource : public ImageSource
{
public:
    explicit DecoderSource(std::unique_ptr<ImageSource> upstream)
        : m_upstream(std::move(upstream))
        , m_input(static_cast<size_t>(kInputBufferBytes))
    {
    }

    // Compressed length is all we know; the decoded length is unknown.
    std::optional<qint64> totalSize() const override
    {
        return std::nullopt;
    }

protected:
    // Returns the number of bytes placed in m_input, 0 at upstream EOF.
    qint64 refill()
    {
        if (m_upstreamEof) {
            return 0;
        }
        const qint64 n = m_upstream->read(m_input.data(), kInputBufferBytes);
        if (n == 0) {
            m_upstreamEof = true;
        }
        return n;
    }

    std::unique_ptr<ImageSource> m_upstream;
    std::vector<char> m_input;
    bool m_upstreamEof = false;
    bool m_done = false;
};

class XzSource : public DecoderSource
{
public:
    explicit XzSource(std::unique_ptr<ImageSource> upstream)
        : DecoderSource(std::move(upstream))
    {
        // Multi-stream .xz files (pixz, pxz) are concatenated streams.
        const lzma_ret ret = lzma_stream_decoder(&m_stream, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            throwDecodeError("xz decoder initialisation failed (" + std::to_string(ret) + ")");
        }
    }

    ~XzSource() override
    {
        lzma_end(&m_stream);
    }

    qint64 read(char *buffer, qint64 maxSize) override
    {
        if (m_done || maxSize <= 0) {
            return 0;
        }

        m_stream.next_out = reinterpret_cast<uint8_t *>(buffer);
        m_stream.avail_out = static_cast<size_t>(maxSize);

        while (true) {
            if (m_stream.avail_in == 0 && !m_upstreamEof) {
                const qint64 n = refill();
                m_stream.next_in = reinterpret_cast<const uint8_t *>(m_input.data());
                m_stream.avail_in = static_cast<size_t>(n);
            }

            const lzma_action action =
                (m_upstreamEof && m_stream.avail_in == 0) ? LZMA_FINISH : LZMA_RUN;
            const lzma_ret ret = lzma_code(&m_stream, action);
            const qint64 produced = maxSize - static_cast<qint64>(m_stream.avail_out);

            if (ret == LZMA_STREAM_END) {
                m_done = true;
                return produced;
            }
            if (ret == LZMA_BUF_ERROR && action == LZMA_FINISH) {
                throwDecodeError("xz stream is truncated");
            }
            if (ret != LZMA_OK && ret != LZMA_BUF_ERROR) {
                throwDecodeError(describe(ret));
            }
            if (produced > 0) {
                return produced;
            }
        }
    }

private:
    static std::string describe(lzma_ret ret)
    {
        switch (ret) {
        case LZMA_FORMAT_ERROR:
            return "input is not in the .xz format";
        case LZMA_DATA_ERROR:
            return "xz data is corrupt";
        case LZMA_MEM_ERROR:
            return "out of memory while decoding xz";
        case LZMA_OPTIONS_ERROR:
            return "unsupported xz options";
        default:
            return "xz decoder error " + std::to_string(ret);
        }
    }

    lzma_stream m_stream = LZMA_STREAM_INIT;
};

class GzipSource : public DecoderSource
{
public:
    explicit GzipSource(std::unique_ptr<ImageSource> upstream)
        : DecoderSource(std::move(upstream))
    {
        // 15 window bits + 32: accept a gzip or zlib header.
        if (inflateInit2(&m_stream, 15 + 32) != Z_OK) {
            throwDecodeError("gzip decoder initialisation failed");
        }
    }

    ~GzipSource() override
    {
        inflateEnd(&m_stream);
    }

    qint64 read(char *buffer, qint64 maxSize) override
    {
        if (m_done || maxSize <= 0) {
            return 0;
        }

        const qint64 capacity = std::min<qint64>(maxSize, UINT_MAX);
        m_stream.next_out = reinterpret_cast<Bytef *>(buffer);
        m_stream.avail_out = static_cast<uInt>(capacity);

        while (true) {
            if (m_stream.avail_in == 0 && !m_upstreamEof) {
                const qint64 n = refill();
                m_stream.next_in = reinterpret_cast<Bytef *>(m_input.data());
                m_stream.avail_in = static_cast<uInt>(n);
            }
            if (m_stream.avail_in == 0 && m_upstreamEof && !m_memberOpen) {
                m_done = true;
                return capacity - static_cast<qint64>(m_stream.avail_out);
            }

            m_memberOpen = true;
            const int ret = inflate(&m_stream, Z_NO_FLUSH);
            const qint64 produced = capacity - static_cast<qint64>(m_stream.avail_out);

            if (ret == Z_STREAM_END) {
                // Another gzip member may follow (pigz, concatenated files).
                m_memberOpen = false;
                inflateReset(&m_stream);
            } else if (ret == Z_BUF_ERROR) {
                if (m_upstreamEof && m_stream.avail_in == 0) {
                    throwDecodeError("gzip stream is truncated");
                }
            } else if (ret != Z_OK) {
                throwDecodeError(m_stream.msg ? std::string("gzip: ") + m_stream.msg
                                              : "gzip decoder error " + std::to_string(ret));
            }

            if (produced > 0) {
                return produced;
            }
        }
    }

private:
    z_stream m_stream{};
    bool m_memberOpen = false;
};

class ZstdSource : public DecoderSource
{
public:
    explicit ZstdSource(std::unique_ptr<ImageSource> upstream)
        : DecoderSource(std::move(upstream))
        , m_context(ZSTD_createDStream())
    {
        if (!m_context) {
            throwDecodeError("zstd decoder initialisation failed");
        }
        const size_t ret = ZSTD_initDStream(m_context);
        if (ZSTD_isError(ret)) {
            ZSTD_freeDStream(m_context);
            throwDecodeError(std::string("zstd: ") + ZSTD_getErrorName(ret));
        }
    }

    ~ZstdSource() override
    {
        ZSTD_freeDStream(m_context);
    }

    qint64 read(char *buffer, qint64 maxSize) override
    {
        if (m_done || maxSize <= 0) {
            return 0;
        }

        ZSTD_outBuffer out{buffer, static_cast<size_t>(maxSize), 0};

        while (true) {
            if (m_in.pos == m_in.size && !m_upstreamEof) {
                const qint64 n = refill();
                m_in = ZSTD_inBuffer{m_input.data(), static_cast<size_t>(n), 0};
            }

            if (m_in.pos == m_in.size && m_upstreamEof) {
                // A zero hint means the last frame was fully decoded and flushed.
                if (m_lastHint == 0) {
                    m_done = true;
                    return static_cast<qint64>(out.pos);
                }
                decompress(out);
                if (out.pos > 0) {
                    return static_cast<qint64>(out.pos);
                }
                throwDecodeError("zstd stream is truncated");
            }

            decompress(out);
            if (out.pos > 0) {
                return static_cast<qint64>(out.pos);
            }
        }
    }

private:
    void decompress(ZSTD_outBuffer &out)
    {
        const size_t ret = ZSTD_decompressStream(m_context, &out, &m_in);
        if (ZSTD_isError(ret)) {
            throwDecodeError(std::string("zstd: ") + ZSTD_getErrorName(ret));
        }
        m_lastHint = ret;
    }

    ZSTD_DStream *m_context = nullptr;
    ZSTD_inBuffer m_in{nullptr, 0, 0};
    size_t m_lastHint = 0;
};

} // namespace

CompressionFormat detectCompression(const std::string &path)
{
    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (endsWith(lower, ".xz")) {
        return CompressionFormat::Xz;
    }
    if (endsWith(lower, ".gz")) {
        return CompressionFormat::Gzip;
    }
    if (endsWith(lower, ".zst")) {
        return CompressionFormat::Zstd;
    }
    if (endsWith(lower, ".zip")) {
        return CompressionFormat::Zip;
    }
    return CompressionFormat::None;
}

void ensureSupported(CompressionFormat format)
{
    if (format == CompressionFormat::Zip) {
        throw ImprintError(ErrorKind::SourceUnavailable,
                           "ZIP files are not supported yet. Please choose an .xz, .gz, or .zst image.");
    }
}

std::unique_ptr<ImageSource> makeDecompressor(CompressionFormat format,
                                              std::unique_ptr<ImageSource> upstream)
{
    ensureSupported(format);

    switch (format) {
    case CompressionFormat::Xz:
        return std::make_unique<XzSource>(std::move(upstream));
    case CompressionFormat::Gzip:
        return std::make_unique<GzipSource>(std::move(upstream));
    case CompressionFormat::Zstd:
        return std::make_unique<ZstdSource>(std::move(upstream));
    case CompressionFormat::None:
    case CompressionFormat::Zip:
        break;
    }
    return upstream;
}

} // namespace imprint
