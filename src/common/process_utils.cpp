#include "common/process_utils.hpp"

#include <QProcess>

namespace krecon {

ProcessResult runProcess(const QString &program,
                         const QStringList &arguments,
                         const QByteArray &input,
                         int timeoutMs)
{
    ProcessResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        return result;
    }
    result.started = true;

    if (!input.isEmpty()) {
        process.write(input);
    }
    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.stdErr = process.readAllStandardError();
        return result;
    }

    result.stdOut = process.readAllStandardOutput();
    result.stdErr = process.readAllStandardError();

    if (process.exitStatus() != QProcess::NormalExit) {
        return result;
    }

    result.finished = true;
    result.exitCode = process.exitCode();
    return result;
}

QString describeCommand(const QString &program, const QStringList &arguments)
{
    if (arguments.isEmpty()) {
        return program;
    }
    return program + QLatin1Char(' ') + arguments.join(QLatin1Char(' '));
}

} // namespace krecon
