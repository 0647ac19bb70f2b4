#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace krecon::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call once from main() before the first event. With trace enabled debug
// events are recorded, and every event is copied to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

// Cheap enough to guard building an expensive debug context.
bool isTraceEnabled();

// Environment the current command works on; added to every event as "env".
// An empty name removes the field.
void setEnvironmentName(const QString &name);

// Correlation ids are per thread. Worker threads adopt their caller's id
// through a CorrelationScope.
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

// One JSON line per event. An empty correlationId falls back to the
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

// $XDG_DATA_HOME/krecon/logs, or ~/.local/share/krecon/logs.
QString logsDirPath();

} // namespace krecon::logging

// The context argument is variadic: a braced nlohmann::json initializer has
// top-level commas.
#define KLOG_DEBUG(component, where, what, why, how, who, corr, ...) \
    ::krecon::logging::logEvent(::krecon::logging::LogLevel::Debug, \
                                ::krecon::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define KLOG_INFO(component, where, what, why, how, who, corr, ...) \
    ::krecon::logging::logEvent(::krecon::logging::LogLevel::Info, \
                                ::krecon::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define KLOG_WARN(component, where, what, why, how, who, corr, ...) \
    ::krecon::logging::logEvent(::krecon::logging::LogLevel::Warn, \
                                ::krecon::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))

#define KLOG_ERROR(component, where, what, why, how, who, corr, ...) \
    ::krecon::logging::logEvent(::krecon::logging::LogLevel::Error, \
                                ::krecon::logging::defaultProcessName(), \
                                (component), (where), (what), (why), (how), (who), (corr), (__VA_ARGS__))
