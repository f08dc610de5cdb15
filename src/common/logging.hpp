#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace inspector::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking one export or verification
// run across components.
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

// INSPECTOR_LOG_DIR, else $HOME/.local/share/crypto-inspector/logs.
QString logsDirPath();
QString defaultProcessName();
QString defaultWho();

} // namespace inspector::logging

#define ILOG_DEBUG(component, where, what, why, how, ctxJson) \
    ::inspector::logging::logEvent(::inspector::logging::LogLevel::Debug, \
                                   ::inspector::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), \
                                   ::inspector::logging::defaultWho(), \
                                   ::inspector::logging::currentCorrelationId(), (ctxJson))

#define ILOG_INFO(component, where, what, why, how, ctxJson) \
    ::inspector::logging::logEvent(::inspector::logging::LogLevel::Info, \
                                   ::inspector::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), \
                                   ::inspector::logging::defaultWho(), \
                                   ::inspector::logging::currentCorrelationId(), (ctxJson))

#define ILOG_WARN(component, where, what, why, how, ctxJson) \
    ::inspector::logging::logEvent(::inspector::logging::LogLevel::Warn, \
                                   ::inspector::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), \
                                   ::inspector::logging::defaultWho(), \
                                   ::inspector::logging::currentCorrelationId(), (ctxJson))

#define ILOG_ERROR(component, where, what, why, how, ctxJson) \
    ::inspector::logging::logEvent(::inspector::logging::LogLevel::Error, \
                                   ::inspector::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), \
                                   ::inspector::logging::defaultWho(), \
                                   ::inspector::logging::currentCorrelationId(), (ctxJson))
