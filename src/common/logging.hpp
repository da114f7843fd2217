#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace imprint::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// IMPRINT_LOG_LEVEL (debug, info, warn, error) raises or lowers the threshold
// of the main log; trace mode always records everything in -trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

std::optional<LogLevel> parseLogLevel(const QString &value);

// Thread-local correlation support for linking the supervisor and worker
// records of one write attempt.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
// Secret-looking context keys are masked before the record is written.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

// Copy of context with password, wifi_password and psk values masked at any depth.
nlohmann::json redactSecrets(const nlohmann::json &context);

QString defaultProcessName();
QString defaultWho();

// Logs live under the invoking user's home even in the elevated worker.
QString logsDirPath();

} // namespace imprint::logging

#define ILOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::imprint::logging::logEvent(::imprint::logging::LogLevel::Debug, \
                                 ::imprint::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::imprint::logging::logEvent(::imprint::logging::LogLevel::Info, \
                                 ::imprint::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::imprint::logging::logEvent(::imprint::logging::LogLevel::Warn, \
                                 ::imprint::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ILOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::imprint::logging::logEvent(::imprint::logging::LogLevel::Error, \
                                 ::imprint::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
