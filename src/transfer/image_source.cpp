#include "transfer/image_source.hpp"

#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/imprint_version.hpp"
#include "common/logging.hpp"

namespace imprint {

namespace {

constexpr qint64 kNetworkReadBufferBytes = 8 * 1024 * 1024;
constexpr int kStallTimeoutMs = 60000;

bool isRemoteUrl(const QString &location)
{
    return location.startsWith(QStringLiteral("http://"), Qt::CaseInsensitive)
        || location.startsWith(QStringLiteral("https://"), Qt::CaseInsensitive);
}

QString localPathOf(const QString &location)
{
    if (location.startsWith(QStringLiteral("file://"), Qt::CaseInsensitive)) {
        return QUrl(location).toLocalFile();
    }
    return location;
}

class FileImageSource : public ImageSource
{
public:
    explicit FileImageSource(const QString &path)
        : m_file(path)
    {
        if (!m_file.open(QIODevice::ReadOnly)) {
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Failed to open image file " + path.toStdString()
                                   + ": " + m_file.errorString().toStdString());
        }
    }

    qint64 read(char *buffer, qint64 maxSize) override
    {
        const qint64 n = m_file.read(buffer, maxSize);
        if (n < 0) {
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Failed to read image file: "
                                   + m_file.errorString().toStdString());
        }
        return n;
    }

    std::optional<qint64> totalSize() const override
    {
        return m_file.size();
    }

private:
    QFile m_file;
};

// Streams an HTTP(S) download through a blocking read() by spinning a local
// event loop until the reply has data. The reply's read buffer is capped so
// a slow device throttles the download instead of buffering the image.
class HttpImageSource : public ImageSource
{
public:
    explicit HttpImageSource(const QUrl &url)
        : m_url(url)
    {
        QNetworkRequest request(url);
        request.setHeader(QNetworkRequest::UserAgentHeader,
                          QStringLiteral("imprint/%1").arg(QStringLiteral(IMPRINT_VERSION)));
        request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                             QNetworkRequest::NoLessSafeRedirectPolicy);

        m_reply.reset(m_manager.get(request));
        m_reply->setReadBufferSize(kNetworkReadBufferBytes);

        // Block until the final response headers are in, so status errors
        // surface before anything touches the device.
        while (!m_reply->isFinished() && !hasFinalStatus()) {
            waitForActivity();
        }
        checkStatus();
    }

    ~HttpImageSource() override
    {
        if (m_reply && !m_reply->isFinished()) {
            m_reply->abort();
        }
    }

    qint64 read(char *buffer, qint64 maxSize) override
    {
        while (m_reply->bytesAvailable() == 0 && !m_reply->isFinished()) {
            waitForActivity();
        }

        if (m_reply->bytesAvailable() == 0) {
            checkStatus();
            checkComplete();
            return 0;
        }

        const qint64 n = m_reply->read(buffer, maxSize);
        if (n < 0) {
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Failed to read/decompress image stream: "
                                   + m_reply->errorString().toStdString());
        }
        m_received += n;
        return n;
    }

    std::optional<qint64> totalSize() const override
    {
        const QVariant length = m_reply->header(QNetworkRequest::ContentLengthHeader);
        if (!length.isValid()) {
            return std::nullopt;
        }
        return length.toLongLong();
    }

private:
    struct ReplyDeleter {
        void operator()(QNetworkReply *reply) const { reply->deleteLater(); }
    };

    bool hasFinalStatus() const
    {
        const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!status.isValid()) {
            return false;
        }
        const int code = status.toInt();
        return code < 300 || code >= 400;
    }

    void waitForActivity()
    {
        QEventLoop loop;
        QTimer stallTimer;
        stallTimer.setSingleShot(true);
        bool stalled = false;

        QObject::connect(m_reply.get(), &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
        QObject::connect(m_reply.get(), &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
        QObject::connect(m_reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
        QObject::connect(&stallTimer, &QTimer::timeout, &loop, [&loop, &stalled]() {
            stalled = true;
            loop.quit();
        });

        stallTimer.start(kStallTimeoutMs);
        loop.exec();

        if (stalled) {
            m_reply->abort();
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Download from " + m_url.toString().toStdString()
                                   + " stalled for "
                                   + std::to_string(kStallTimeoutMs / 1000) + " seconds");
        }
    }

    void checkStatus()
    {
        const QVariant status = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (status.isValid() && (status.toInt() < 200 || status.toInt() >= 300)) {
            std::string message = "Download failed with status: " + std::to_string(status.toInt());
            const QString reason =
                m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toString();
            if (!reason.isEmpty()) {
                message += " " + reason.toStdString();
            }
            throw ImprintError(ErrorKind::SourceUnavailable, message);
        }

        if (m_reply->error() != QNetworkReply::NoError) {
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Failed to download from " + m_url.toString().toStdString()
                                   + ": " + m_reply->errorString().toStdString());
        }
    }

    // A server that closes early is not always reported as a reply error.
    void checkComplete() const
    {
        const std::optional<qint64> expected = totalSize();
        if (expected && m_received < *expected) {
            throw ImprintError(ErrorKind::SourceUnavailable,
                               "Download from " + m_url.toString().toStdString()
                                   + " ended after " + std::to_string(m_received) + " of "
                                   + std::to_string(*expected) + " bytes");
        }
    }

    QUrl m_url;
    qint64 m_received = 0;
    QNetworkAccessManager m_manager;
    std::unique_ptr<QNetworkReply, ReplyDeleter> m_reply;
};

} // namespace

std::string sourcePathOf(const std::string &location)
{
    const QString value = QString::fromStdString(location);
    if (isRemoteUrl(value) || value.startsWith(QStringLiteral("file://"), Qt::CaseInsensitive)) {
        return QUrl(value).path().toStdString();
    }
    return location;
}

std::unique_ptr<ImageSource> openImageSource(const std::string &location)
{
    const QString value = QString::fromStdString(location);
    if (value.isEmpty()) {
        throw ImprintError(ErrorKind::SourceUnavailable, "No URL provided for the selected OS");
    }

    ILOG_INFO(QStringLiteral("ImageSource"),
              QStringLiteral("openImageSource"),
              QStringLiteral("source_open"),
              QStringLiteral("transfer_start"),
              isRemoteUrl(value) ? QStringLiteral("http") : QStringLiteral("file"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"location", location}}));

    if (isRemoteUrl(value)) {
        const QUrl url(value);
        if (!url.isValid()) {
            throw ImprintError(ErrorKind::SourceUnavailable, "Invalid image URL: " + location);
        }
        return std::make_unique<HttpImageSource>(url);
    }
    return std::make_unique<FileImageSource>(localPathOf(value));
}

} // namespace imprint
