#include "worker/worker_invocation.hpp"

#include <QByteArray>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"

namespace imprint {

namespace {

QString takeValue(const QStringList &args, int &index, const QString &flag)
{
    if (index + 1 >= args.size()) {
        throw ImprintError(ErrorKind::ProtocolError,
                           "Missing value for " + flag.toStdString());
    }
    ++index;
    return args.at(index);
}

ProvisioningSettings decodeSettings(const QString &encoded)
{
    const auto decoded = QByteArray::fromBase64Encoding(
        encoded.toLatin1(), QByteArray::AbortOnBase64DecodingErrors);
    if (!decoded) {
        throw ImprintError(ErrorKind::ProtocolError, "Worker options are not valid base64");
    }

    try {
        const auto parsed = nlohmann::json::parse(decoded.decoded.toStdString());
        if (!parsed.is_object()) {
            throw ImprintError(ErrorKind::ProtocolError, "Worker options are not a JSON object");
        }
        return parsed.get<ProvisioningSettings>();
    } catch (const nlohmann::json::exception &ex) {
        throw ImprintError(ErrorKind::ProtocolError,
                           std::string("Worker options are not valid settings JSON: ") + ex.what());
    }
}

} // namespace

QStringList WorkerInvocation::toArguments() const
{
    QStringList args;
    args << QStringLiteral("--worker")
         << QStringLiteral("--device") << QString::fromStdString(devicePath)
         << QStringLiteral("--image") << QString::fromStdString(imageUrl);
    if (expectedSize) {
        args << QStringLiteral("--size") << QString::number(*expectedSize);
    }
    if (expectedSha256) {
        args << QStringLiteral("--sha256") << QString::fromStdString(*expectedSha256);
    }
    const QByteArray json = QByteArray::fromStdString(nlohmann::json(settings).dump());
    args << QStringLiteral("--options") << QString::fromLatin1(json.toBase64());
    if (!correlationId.empty()) {
        args << QStringLiteral("--corr") << QString::fromStdString(correlationId);
    }
    if (trace) {
        args << QStringLiteral("--trace");
    }
    return args;
}

WorkerInvocation WorkerInvocation::fromArguments(const QStringList &args)
{
    WorkerInvocation invocation;

    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (arg == QLatin1String("--device")) {
            invocation.devicePath = takeValue(args, i, arg).toStdString();
        } else if (arg == QLatin1String("--image")) {
            invocation.imageUrl = takeValue(args, i, arg).toStdString();
        } else if (arg == QLatin1String("--size")) {
            const QString value = takeValue(args, i, arg);
            bool ok = false;
            const qulonglong size = value.toULongLong(&ok);
            if (!ok) {
                throw ImprintError(ErrorKind::ProtocolError,
                                   "Invalid --size value: " + value.toStdString());
            }
            invocation.expectedSize = static_cast<std::uint64_t>(size);
        } else if (arg == QLatin1String("--sha256")) {
            invocation.expectedSha256 = takeValue(args, i, arg).toStdString();
        } else if (arg == QLatin1String("--options")) {
            invocation.settings = decodeSettings(takeValue(args, i, arg));
        } else if (arg == QLatin1String("--corr")) {
            invocation.correlationId = takeValue(args, i, arg).toStdString();
        } else if (arg == QLatin1String("--trace")) {
            invocation.trace = true;
        }
    }

    if (invocation.devicePath.empty() || invocation.imageUrl.empty()) {
        throw ImprintError(ErrorKind::ProtocolError, "Missing required arguments for worker");
    }
    return invocation;
}

ImageDescriptor WorkerInvocation::image() const
{
    ImageDescriptor image;
    image.name = "Worker Image";
    image.url = imageUrl;
    image.expectedSize = expectedSize;
    image.expectedSha256 = expectedSha256;
    return image;
}

TargetDevice WorkerInvocation::device() const
{
    TargetDevice device;
    device.path = devicePath;
    device.description = "Target Drive";
    device.isRemovable = true;
    return device;
}

} // namespace imprint
