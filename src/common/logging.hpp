#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace auditray::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Verbose mode writes debug lines and mirrors every line to stderr.
void initLogging(const QString &processName, bool verbose);

bool isVerbose();

QString logFilePath();

// Thread-local correlation id, used to tie together the lines of one check.
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

// Structured log event, written as one JSON line.
void logEvent(LogLevel level,
              const QString &component,
              const char *where,
              const QString &what,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();

} // namespace auditray::logging

#define ALOG_DEBUG(component, what, ctxJson) \
    ::auditray::logging::logEvent(::auditray::logging::LogLevel::Debug, \
                                  (component), __func__, (what), (ctxJson))

#define ALOG_INFO(component, what, ctxJson) \
    ::auditray::logging::logEvent(::auditray::logging::LogLevel::Info, \
                                  (component), __func__, (what), (ctxJson))

#define ALOG_WARN(component, what, ctxJson) \
    ::auditray::logging::logEvent(::auditray::logging::LogLevel::Warn, \
                                  (component), __func__, (what), (ctxJson))

#define ALOG_ERROR(component, what, ctxJson) \
    ::auditray::logging::logEvent(::auditray::logging::LogLevel::Error, \
                                  (component), __func__, (what), (ctxJson))
