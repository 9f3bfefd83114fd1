#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <utility>

#include "common/settings.hpp"

namespace tokentally::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// One append-only JSON-lines file, reopened after rotation.
class LogFile {
public:
    explicit LogFile(QString path)
        : m_path(std::move(path))
    {
    }

    const QString &path() const { return m_path; }

    bool append(const QByteArray &line)
    {
        if (m_file && m_file->size() >= kMaxLogSizeBytes) {
            rotate();
        }
        if (!m_file && !open()) {
            return false;
        }
        m_file->write(line);
        m_file->write("\n");
        m_file->flush();
        return true;
    }

private:
    bool open()
    {
        QDir().mkpath(QFileInfo(m_path).absolutePath());
        if (QFile::exists(m_path) && QFileInfo(m_path).size() >= kMaxLogSizeBytes) {
            rotate();
        }
        auto file = std::make_unique<QFile>(m_path);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            return false;
        }
        m_file = std::move(file);
        return true;
    }

    void rotate()
    {
        m_file.reset();
        const QString rotated = m_path + QStringLiteral(".1");
        QFile::remove(rotated);
        QFile::rename(m_path, rotated);
    }

    QString m_path;
    std::unique_ptr<QFile> m_file;
};

struct Sink {
    QString processName;
    bool traceEnabled = false;
    std::unique_ptr<LogFile> main;
    std::unique_ptr<LogFile> trace;
};

std::mutex g_sinkMutex;
Sink g_sink;

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty() ? QStringLiteral("tokentally") : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

// Files are bound lazily so HOME/XDG_DATA_HOME changes before the first
// event are honored. Caller holds g_sinkMutex.
LogFile &mainFile(const QString &process)
{
    const QString path = logFilePath(process, QStringLiteral(".log"));
    if (!g_sink.main || g_sink.main->path() != path) {
        g_sink.main = std::make_unique<LogFile>(path);
    }
    return *g_sink.main;
}

LogFile &traceFile(const QString &process)
{
    const QString path = logFilePath(process, QStringLiteral("-trace.log"));
    if (!g_sink.trace || g_sink.trace->path() != path) {
        g_sink.trace = std::make_unique<LogFile>(path);
    }
    return *g_sink.trace;
}

QByteArray formatLine(LogLevel level,
                      const QString &processName,
                      const QString &component,
                      const QString &where,
                      const QString &what,
                      const QString &why,
                      const QString &how,
                      const QString &who,
                      const QString &corr,
                      const nlohmann::json &context)
{
    const auto threadId = reinterpret_cast<quintptr>(QThread::currentThreadId());
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", QStringLiteral("0x%1").arg(threadId, 0, 16).toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", corr.toStdString()},
        {"context", context.is_null() ? nlohmann::json::object() : context}
    };
    return QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace

QString logsDirPath()
{
    const auto dir = dataHomeDir() / "tokentally" / "logs";
    return QString::fromStdString(dir.string());
}

void initLogging(const QString &processName, bool traceEnabled)
{
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    g_sink.processName = processName;
    g_sink.traceEnabled = traceEnabled;
    g_sink.main.reset();
    g_sink.trace.reset();
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_sinkMutex);
    return g_sink.traceEnabled;
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

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_sinkMutex);
        if (!g_sink.processName.isEmpty()) {
            return g_sink.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("tokentally");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<qulonglong>(getuid()));
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
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString corr = correlationId.isEmpty() ? currentCorrelationId() : correlationId;
    const QByteArray line =
        formatLine(level, process, component, where, what, why, how, who, corr, context);

    std::lock_guard<std::mutex> lock(g_sinkMutex);
    const bool writeMain = level != LogLevel::Debug || g_sink.traceEnabled;
    if (writeMain && !mainFile(process).append(line)) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
    if (g_sink.traceEnabled) {
        traceFile(process).append(line);
    }
}

} // namespace tokentally::logging
