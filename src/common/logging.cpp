#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace krecon::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

// Rotated files kept next to the live one: <file>.1 (newest) to <file>.3.
constexpr int kKeptGenerations = 3;

struct LoggerState {
    std::mutex mutex;
    QString processName;
    QString environment;
    std::atomic<bool> trace{false};
};

LoggerState &loggerState()
{
    static LoggerState state;
    return state;
}

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

QString generationPath(const QString &path, int generation)
{
    return path + QLatin1Char('.') + QString::number(generation);
}

// Shifts <file>.N to <file>.N+1, dropping the oldest, then moves the live
// file to <file>.1.
void rotate(const QString &path)
{
    QFile::remove(generationPath(path, kKeptGenerations));
    for (int generation = kKeptGenerations - 1; generation >= 1; --generation) {
        const QString from = generationPath(path, generation);
        if (QFile::exists(from)) {
            QFile::rename(from, generationPath(path, generation + 1));
        }
    }
    QFile::rename(path, generationPath(path, 1));
}

// Caller holds the logger mutex.
void appendLine(const QString &path, const QByteArray &line)
{
    if (QFileInfo(path).size() >= kMaxLogSizeBytes) {
        rotate(path);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.trace = traceEnabled;
}

bool isTraceEnabled()
{
    return loggerState().trace;
}

void setEnvironmentName(const QString &name)
{
    LoggerState &state = loggerState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.environment = name;
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
    QString dataHome = qEnvironmentVariable("XDG_DATA_HOME");
    if (dataHome.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        dataHome = home.isEmpty() ? QStringLiteral(".local/share")
                                  : home + QStringLiteral("/.local/share");
    }
    return dataHome + QStringLiteral("/krecon/logs");
}

QString defaultProcessName()
{
    {
        LoggerState &state = loggerState();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.processName.isEmpty()) {
            return state.processName;
        }
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("krecon");
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<int>(getuid()));
    }();
    return who;
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
    LoggerState &state = loggerState();
    const bool trace = state.trace;
    if (level == LogLevel::Debug && !trace) {
        return;
    }

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    nlohmann::json event = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };

    const QString dir = logsDirPath();
    const QString base = dir + QLatin1Char('/') + process;

    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.environment.isEmpty()) {
        event["env"] = state.environment.toStdString();
    }
    const QByteArray line = QByteArray::fromStdString(event.dump());

    QDir().mkpath(dir);
    appendLine(base + QStringLiteral(".log"), line);
    if (trace) {
        appendLine(base + QStringLiteral("-trace.log"), line);
    }
}

} // namespace krecon::logging
