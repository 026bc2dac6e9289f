#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <cstdio>
#include <mutex>

namespace auditray::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
bool g_verbose = false;
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

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/auditray/logs");
    }
    return home + QStringLiteral("/.local/share/auditray/logs");
}

void rotateIfNeeded(const QString &path)
{
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void writeLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(logsDirPath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        // Never lose a line because the log directory is unwritable.
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }

    file.write(line);
    file.write("\n");
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const QString &processName, bool verbose)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_processName = processName;
    g_verbose = verbose;
}

bool isVerbose()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_verbose;
}

QString logFilePath()
{
    return logsDirPath() + QDir::separator() + defaultProcessName()
        + QStringLiteral(".log");
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
    if (!g_processName.isEmpty()) {
        return g_processName;
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("auditray");
}

void logEvent(LogLevel level,
              const QString &component,
              const char *where,
              const QString &what,
              const nlohmann::json &context)
{
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelToString(level).toStdString()},
        {"process", defaultProcessName().toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where ? where : ""},
        {"what", what.toStdString()},
        {"corr", t_corrId.toStdString()},
        {"context", context}
    };

    const QByteArray line = QByteArray::fromStdString(payload.dump());
    const QString path = logFilePath();

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (level == LogLevel::Debug && !g_verbose) {
        return;
    }

    writeLine(path, line);
    if (g_verbose) {
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

} // namespace auditray::logging
