#include "transfer/transfer_engine.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include <QCryptographicHash>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "transfer/block_device.hpp"
#include "transfer/decompressor.hpp"
#include "transfer/image_source.hpp"

namespace imprint {

namespace {

using Clock = std::chrono::steady_clock;

// Percent stays below 100 until the whole run has been verified.
constexpr double kMaxReportedPercent = 99.0;

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

double megabytesPerSecond(std::uint64_t bytes, Clock::time_point start)
{
    const double seconds =
        std::chrono::duration<double>(Clock::now() - start).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return (static_cast<double>(bytes) / 1024.0 / 1024.0) / seconds;
}

double clampedPercent(std::uint64_t done, std::uint64_t total)
{
    const double percent = static_cast<double>(done) / static_cast<double>(total) * 100.0;
    return std::min(percent, kMaxReportedPercent);
}

std::string formatOneDecimal(double value)
{
    return QString::number(value, 'f', 1).toStdString();
}

} // namespace

TransferEngine::TransferEngine(TransferEventSink sink)
    : m_sink(std::move(sink))
{
}

void TransferEngine::setProgressInterval(std::chrono::milliseconds interval)
{
    m_progressInterval = interval;
}

void TransferEngine::setChunkSize(std::size_t bytes)
{
    m_chunkSize = std::max<std::size_t>(bytes, 512);
}

void TransferEngine::setDeviceOpener(DeviceOpener opener)
{
    m_openDevice = std::move(opener);
}

void TransferEngine::emitEvent(const TransferEvent &event) const
{
    if (m_sink) {
        m_sink(event);
    }
}

TransferSummary TransferEngine::transfer(const ImageDescriptor &image,
                                         const TargetDevice &device)
{
    const std::uint64_t expectedSize = image.expectedSize.value_or(0);

    emitEvent(TransferEvent::progress(0.0));
    emitEvent(TransferEvent::phaseChange(TransferPhase::Writing));
    emitEvent(TransferEvent::status("Starting download..."));

    ILOG_INFO(QStringLiteral("TransferEngine"),
              QStringLiteral("transfer"),
              QStringLiteral("transfer_started"),
              QStringLiteral("worker_job"),
              QStringLiteral("stream_write_verify"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"image", image.url},
                              {"device", device.path},
                              {"expectedSize", expectedSize},
                              {"hasExpectedSha256", image.expectedSha256.has_value()}}));

    if (image.url.empty()) {
        throw ImprintError(ErrorKind::SourceUnavailable, "No URL provided for the selected OS");
    }

    // Rejecting unsupported formats needs only the path, so it happens
    // before any byte is fetched or the device is touched.
    const CompressionFormat format = detectCompression(sourcePathOf(image.url));
    ensureSupported(format);

    if (device.size > 0 && expectedSize > device.size) {
        throw ImprintError(ErrorKind::DeviceUnavailable,
                           "Image (" + std::to_string(expectedSize)
                               + " bytes) does not fit on " + device.path + " ("
                               + std::to_string(device.size) + " bytes)");
    }

    std::unique_ptr<ImageSource> stream =
        makeDecompressor(format, openImageSource(image.url));

    std::unique_ptr<BlockDevice> target = m_openDevice
        ? m_openDevice(device.path)
        : std::make_unique<BlockDevice>(device.path);

    std::vector<char> buffer(m_chunkSize);
    QCryptographicHash sourceHash(QCryptographicHash::Sha256);
    std::uint64_t totalWritten = 0;

    const Clock::time_point writeStart = Clock::now();
    Clock::time_point lastUpdate = writeStart;

    while (true) {
        // Fill the chunk completely so device writes stay large and aligned.
        qint64 filled = 0;
        while (filled < static_cast<qint64>(buffer.size())) {
            const qint64 n = stream->read(buffer.data() + filled,
                                          static_cast<qint64>(buffer.size()) - filled);
            if (n == 0) {
                break;
            }
            filled += n;
        }
        if (filled == 0) {
            break;
        }

        target->writeAll(buffer.data(), filled);
        sourceHash.addData(buffer.data(), static_cast<int>(filled));
        totalWritten += static_cast<std::uint64_t>(filled);

        if (Clock::now() - lastUpdate >= m_progressInterval) {
            const double speed = megabytesPerSecond(totalWritten, writeStart);
            if (expectedSize > 0) {
                const double percent = clampedPercent(totalWritten, expectedSize);
                emitEvent(TransferEvent::progress(percent));
                emitEvent(TransferEvent::status("Writing... " + formatOneDecimal(percent)
                                                + "% (" + formatOneDecimal(speed) + " MB/s)"));
            } else {
                emitEvent(TransferEvent::status("Writing... "
                                                + std::to_string(totalWritten / 1024 / 1024)
                                                + " MB (" + formatOneDecimal(speed) + " MB/s)"));
            }
            lastUpdate = Clock::now();
        }

        if (filled < static_cast<qint64>(buffer.size())) {
            break;
        }
    }

    emitEvent(TransferEvent::status("Syncing to disk..."));
    target->sync();

    emitEvent(TransferEvent::phaseChange(TransferPhase::Verifying));
    emitEvent(TransferEvent::status("Verifying download..."));

    const std::string sourceHex = sourceHash.result().toHex().toStdString();

    if (image.expectedSha256 && toLower(*image.expectedSha256) != sourceHex) {
        ILOG_WARN(QStringLiteral("TransferEngine"),
                  QStringLiteral("transfer"),
                  QStringLiteral("download_hash_mismatch"),
                  QStringLiteral("integrity_check"),
                  QStringLiteral("sha256"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"expected", *image.expectedSha256},
                                  {"calculated", sourceHex}}));
        throw ImprintError(ErrorKind::IntegrityError,
                           "Download verification failed!\nExpected: " + *image.expectedSha256
                               + "\nCalculated: " + sourceHex);
    }

    emitEvent(TransferEvent::status("Verifying write (reading back)..."));

    target->rewind();

    QCryptographicHash diskHash(QCryptographicHash::Sha256);
    std::uint64_t totalRead = 0;
    const Clock::time_point verifyStart = Clock::now();
    lastUpdate = verifyStart;

    while (totalRead < totalWritten) {
        const std::uint64_t remaining = totalWritten - totalRead;
        const qint64 toRead = static_cast<qint64>(
            std::min<std::uint64_t>(buffer.size(), remaining));
        const qint64 n = target->read(buffer.data(), toRead);
        if (n == 0) {
            throw ImprintError(ErrorKind::WriteVerificationError,
                               "Unexpected EOF during verification");
        }

        diskHash.addData(buffer.data(), static_cast<int>(n));
        totalRead += static_cast<std::uint64_t>(n);

        if (Clock::now() - lastUpdate >= m_progressInterval) {
            const double speed = megabytesPerSecond(totalRead, verifyStart);
            if (expectedSize > 0) {
                const double percent = clampedPercent(totalRead, expectedSize);
                emitEvent(TransferEvent::verifyProgress(percent));
                emitEvent(TransferEvent::status("Verifying... " + formatOneDecimal(percent)
                                                + "% (" + formatOneDecimal(speed) + " MB/s)"));
            } else {
                emitEvent(TransferEvent::status("Verifying... "
                                                + std::to_string(totalRead / 1024 / 1024)
                                                + " MB (" + formatOneDecimal(speed) + " MB/s)"));
            }
            lastUpdate = Clock::now();
        }
    }

    const std::string diskHex = diskHash.result().toHex().toStdString();
    if (diskHex != sourceHex) {
        ILOG_ERROR(QStringLiteral("TransferEngine"),
                   QStringLiteral("transfer"),
                   QStringLiteral("write_hash_mismatch"),
                   QStringLiteral("read_back"),
                   QStringLiteral("sha256"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"source", sourceHex}, {"onDisk", diskHex}}));
        throw ImprintError(ErrorKind::WriteVerificationError,
                           "Write verification failed!\nSource hash: " + sourceHex
                               + "\nOn-disk hash: " + diskHex);
    }

    ILOG_INFO(QStringLiteral("TransferEngine"),
              QStringLiteral("transfer"),
              QStringLiteral("transfer_verified"),
              QStringLiteral("worker_job"),
              QStringLiteral("stream_write_verify"),
              logging::defaultWho(),
              logging::currentCorrelationId(),
              (nlohmann::json{{"bytesWritten", totalWritten}, {"sha256", sourceHex}}));

    TransferSummary summary;
    summary.bytesWritten = totalWritten;
    summary.sourceSha256 = sourceHex;
    return summary;
}

} // namespace imprint
