#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace krecon {

struct ProcessResult {
    bool started = false;
    bool finished = false;
    int exitCode = -1;
    QByteArray stdOut;
    QByteArray stdErr;
};

// Runs a program to completion, feeding `input` on stdin. Blocks the calling
// thread; safe to call from worker threads without an event loop.
// A negative timeout waits forever.
ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         const QByteArray &input = QByteArray(),
                         int timeoutMs = -1);

// "program arg1 arg2" for error messages and logs.
QString describeCommand(const QString &program, const QStringList &arguments);

} // namespace krecon
