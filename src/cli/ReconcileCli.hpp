#pragma once

#include <functional>
#include <memory>

#include <QString>
#include <QStringList>

#include "common/environment.hpp"
#include "common/models.hpp"

namespace krecon {

class Reconciler;

using ReconcilerFactory =
    std::function<std::unique_ptr<Reconciler>(const EnvironmentConfig &env)>;

class ReconcileCli
{
public:
    // Without a factory, commands connect through kubectl.
    explicit ReconcileCli(ReconcilerFactory factory = ReconcilerFactory());

    // CLI dispatcher for info, diff, apply and orphans.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int dispatch(const QString &command, const QStringList &args);

    int runInfo(const QStringList &args);
    int runDiff(const QStringList &args);
    int runApply(const QStringList &args);
    int runOrphans(const QStringList &args);
    int runVersion();

    std::unique_ptr<Reconciler> openReconciler(const QStringList &args) const;
    ManifestList loadManifests(const QStringList &args) const;

    ReconcilerFactory m_factory;
};

} // namespace krecon
