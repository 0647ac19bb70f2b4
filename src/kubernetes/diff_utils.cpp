#include "kubernetes/diff_utils.hpp"

#include <QFile>
#include <QTemporaryDir>

#include "common/errors.hpp"
#include "common/process_utils.hpp"

namespace krecon {

namespace {

bool writeFile(const QString &path, const std::string &content)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(content);
    return file.write(data) == data.size();
}

} // namespace

std::optional<std::string> unifiedDiff(const std::string &label,
                                       const std::string &live,
                                       const std::string &merged)
{
    QTemporaryDir dir;
    if (!dir.isValid()) {
        throw KreconError("cannot create a temporary directory for diffing");
    }

    const QString livePath = dir.filePath(QStringLiteral("live"));
    const QString mergedPath = dir.filePath(QStringLiteral("merged"));
    if (!writeFile(livePath, live) || !writeFile(mergedPath, merged)) {
        throw KreconError("cannot write diff inputs for '" + label + "'");
    }

    const QString name = QString::fromStdString(label);
    const QStringList arguments = {
        QStringLiteral("-u"), QStringLiteral("-N"),
        QStringLiteral("--label"), QStringLiteral("LIVE/") + name,
        QStringLiteral("--label"), QStringLiteral("MERGED/") + name,
        livePath, mergedPath,
    };

    // diff(1) exits 0 for identical input, 1 for differences, 2 for trouble.
    const ProcessResult result = runProcess(QStringLiteral("diff"), arguments);
    if (result.finished && result.exitCode == 0) {
        return std::nullopt;
    }
    if (result.finished && result.exitCode == 1) {
        return result.stdOut.toStdString();
    }
    throw CommandFailed(describeCommand(QStringLiteral("diff"), arguments).toStdString(),
                        result.finished ? result.exitCode : -1,
                        result.stdErr.trimmed().toStdString());
}

std::string diffstat(const std::string &diffText)
{
    const ProcessResult result = runProcess(QStringLiteral("diffstat"), {},
                                            QByteArray::fromStdString(diffText));
    if (!result.finished || result.exitCode != 0) {
        throw CommandFailed("diffstat", result.finished ? result.exitCode : -1,
                            result.stdErr.trimmed().toStdString());
    }
    return result.stdOut.toStdString();
}

} // namespace krecon
