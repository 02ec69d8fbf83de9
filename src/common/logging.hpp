#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace twreport::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

// Thread-local correlation id. One report parse, or one twreport-dump run,
// tags every event it logs with the same id.
QString currentCorrelationId();

// "<prefix>-<8 hex digits>", unique enough to tell runs apart in one log.
QString newCorrelationId(const QString &prefix);

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
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

QString defaultProcessName();
QString defaultWho();
QString logsDirPath();

} // namespace twreport::logging

#define TWLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::twreport::logging::logEvent(::twreport::logging::LogLevel::Debug, \
                                  ::twreport::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TWLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::twreport::logging::logEvent(::twreport::logging::LogLevel::Info, \
                                  ::twreport::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TWLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::twreport::logging::logEvent(::twreport::logging::LogLevel::Warn, \
                                  ::twreport::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TWLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::twreport::logging::logEvent(::twreport::logging::LogLevel::Error, \
                                  ::twreport::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
