#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstdio>
#include <mutex>
#include <vector>

namespace imprint::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
// Each write attempt adds a worker log; keep a few attempts around.
constexpr int kRotatedGenerations = 3;

std::mutex g_logMutex;
bool g_traceEnabled = false;
LogLevel g_minimumLevel = LogLevel::Info;
QString g_processName;

thread_local QString t_corrId;

QString levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

bool isSecretKey(const std::string &key)
{
    return key == "password" || key == "wifi_password" || key == "wifiPassword"
        || key == "psk";
}

struct InvokingAccount {
    uid_t uid = 0;
    gid_t gid = 0;
    QString home;
};

// The user who asked for elevation, when this process is the sudo/pkexec
// child.
std::optional<InvokingAccount> invokingAccount()
{
    if (geteuid() != 0) {
        return std::nullopt;
    }
    long uid = -1;
    for (const char *name : {"SUDO_UID", "PKEXEC_UID"}) {
        bool ok = false;
        const long value = qEnvironmentVariable(name).toLong(&ok);
        if (ok && value > 0) {
            uid = value;
            break;
        }
    }
    if (uid < 0) {
        return std::nullopt;
    }

    struct passwd pwd;
    struct passwd *result = nullptr;
    long bufferSize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufferSize <= 0) {
        bufferSize = 16384;
    }
    std::vector<char> buffer(static_cast<size_t>(bufferSize));
    if (getpwuid_r(static_cast<uid_t>(uid), &pwd, buffer.data(), buffer.size(), &result) != 0
        || !result) {
        return std::nullopt;
    }

    InvokingAccount account;
    account.uid = result->pw_uid;
    account.gid = result->pw_gid;
    account.home = result->pw_dir ? QString::fromLocal8Bit(result->pw_dir) : QString();
    return account;
}

// Files created by the elevated worker would otherwise be root-owned inside
// the user's home and block the next unprivileged run.
void handBackOwnership(const QString &path)
{
    const auto account = invokingAccount();
    if (!account) {
        return;
    }
    const QByteArray native = QFile::encodeName(path);
    if (::chown(native.constData(), account->uid, account->gid) != 0) {
        fprintf(stderr, "imprint: cannot hand %s back to uid %d\n",
                native.constData(), static_cast<int>(account->uid));
    }
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("imprint")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        QFile::rename(path + QStringLiteral(".%1").arg(generation),
                      path + QStringLiteral(".%1").arg(generation + 1));
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void writeLine(const QString &path, const QString &line)
{
    const QString dir = logsDirPath();
    if (!QFileInfo::exists(dir) && QDir().mkpath(dir)) {
        handBackOwnership(dir);
    }
    rotateIfNeeded(path);

    const bool created = !QFileInfo::exists(path);
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // stderr, never stdout: the worker's stdout carries the event stream.
        fprintf(stderr, "%s\n", line.toUtf8().constData());
        return;
    }

    file.write(line.toUtf8());
    file.write("\n");
    if (created) {
        handBackOwnership(path);
    }
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    const auto level = parseLogLevel(qEnvironmentVariable("IMPRINT_LOG_LEVEL"));

    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_traceEnabled = traceEnabled;
    g_minimumLevel = traceEnabled ? LogLevel::Debug : level.value_or(LogLevel::Info);
}

bool isTraceEnabled()
{
    return g_traceEnabled;
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (normalized == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (normalized == QLatin1String("warn") || normalized == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (normalized == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString logsDirPath()
{
    // pkexec resets HOME to root's; sudo may or may not keep it.
    const auto account = invokingAccount();
    QString home = account ? account->home : QString();
    if (home.isEmpty()) {
        home = qEnvironmentVariable("HOME");
    }
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/imprint/logs");
    }
    return home + QStringLiteral("/.local/share/imprint/logs");
}

QString defaultProcessName()
{
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("imprint");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2,euid:%3")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()))
        .arg(static_cast<int>(geteuid()));
}

nlohmann::json redactSecrets(const nlohmann::json &context)
{
    if (context.is_object()) {
        nlohmann::json masked = nlohmann::json::object();
        for (auto it = context.begin(); it != context.end(); ++it) {
            if (isSecretKey(it.key()) && !it.value().is_null()) {
                masked[it.key()] = "********";
            } else {
                masked[it.key()] = redactSecrets(it.value());
            }
        }
        return masked;
    }
    if (context.is_array()) {
        nlohmann::json masked = nlohmann::json::array();
        for (const auto &item : context) {
            masked.push_back(redactSecrets(item));
        }
        return masked;
    }
    return context;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", processName.toStdString()},
        {"pid", static_cast<qint64>(getpid())},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", redactSecrets(context)}
    };

    const QString line = QString::fromStdString(payload.dump());

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString mainPath = logFilePath(process, QStringLiteral(".log"));
    const QString tracePath = logFilePath(process, QStringLiteral("-trace.log"));

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (static_cast<int>(level) >= static_cast<int>(g_minimumLevel)) {
        writeLine(mainPath, line);
    }

    if (g_traceEnabled) {
        writeLine(tracePath, line);
    }
}

} // namespace imprint::logging
