#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace tokentally::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Binds the process name used for log file names. Debug events are only
// written when traceEnabled; every event is then mirrored to the trace file.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory receiving <process>.log and <process>-trace.log.
QString logsDirPath();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Writes one JSON object per line. An empty correlationId falls back to the
// thread's current one.
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

} // namespace tokentally::logging

#define TTLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::tokentally::logging::logEvent((level), \
                                    ::tokentally::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TTLOG_DEBUG(...) TTLOG_EVENT(::tokentally::logging::LogLevel::Debug, __VA_ARGS__)
#define TTLOG_INFO(...) TTLOG_EVENT(::tokentally::logging::LogLevel::Info, __VA_ARGS__)
#define TTLOG_WARN(...) TTLOG_EVENT(::tokentally::logging::LogLevel::Warn, __VA_ARGS__)
#define TTLOG_ERROR(...) TTLOG_EVENT(::tokentally::logging::LogLevel::Error, __VA_ARGS__)
