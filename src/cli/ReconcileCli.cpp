#include "cli/ReconcileCli.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

#include <QFile>
#include <QUuid>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/krecon_version.hpp"
#include "common/logging.hpp"
#include "kubernetes/reconciler.hpp"

namespace krecon {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  krecon info --env PATH [--format text|json]\n"
        "  krecon diff --env PATH --manifests PATH [--strategy native|subset] [--summarize]\n"
        "  krecon apply --env PATH --manifests PATH [--force] [--auto-approve]\n"
        "  krecon orphans --env PATH --manifests PATH [--format text|json]\n"
        "  krecon version\n");
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

bool validFormat(const QString &format)
{
    return format == QStringLiteral("text") || format == QStringLiteral("json");
}

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot open '" + path.toStdString() + "'");
    }
    try {
        return nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw InvalidManifest("'" + path.toStdString() + "' is not valid JSON: " + ex.what());
    }
}

void renderInfoText(const ClusterInfo &info, const EnvironmentConfig &env,
                    const std::string &strategy)
{
    std::cout << "Environment:    " << env.name << "\n";
    std::cout << "Namespace:      " << env.namespaceName << "\n";
    std::cout << "Cluster:        " << info.clusterName << "\n";
    std::cout << "API server:     " << info.apiServer << "\n";
    std::cout << "Context:        " << info.contextName << "\n";
    std::cout << "Server version: " << info.gitVersion << "\n";
    std::cout << "Diff strategy:  " << strategy << "\n";
}

} // namespace

ReconcileCli::ReconcileCli(ReconcilerFactory factory)
    : m_factory(std::move(factory))
{
    if (!m_factory) {
        m_factory = [](const EnvironmentConfig &env) {
            return Reconciler::connect(env);
        };
    }
}

int ReconcileCli::run(int argc, char *argv[])
{
    // CLI entry: parse the subcommand and delegate to the command handler.
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    logging::CorrelationScope corr(QUuid::createUuid().toString(QUuid::WithoutBraces));
    logging::setEnvironmentName(QString());
    KLOG_INFO(QStringLiteral("ReconcileCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"command", command.toStdString()}});

    try {
        return dispatch(command, args);
    } catch (const NotConfirmed &ex) {
        KLOG_INFO(QStringLiteral("ReconcileCli"),
                  QStringLiteral("run"),
                  QStringLiteral("cli_aborted"),
                  QStringLiteral("user_declined"),
                  QStringLiteral("confirmation"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"command", command.toStdString()},
                                 {"reason", ex.what()}});
        std::cerr << "Aborted." << std::endl;
        return 1;
    } catch (const KreconError &ex) {
        KLOG_ERROR(QStringLiteral("ReconcileCli"),
                   QStringLiteral("run"),
                   QStringLiteral("cli_failed"),
                   QStringLiteral("command_error"),
                   QStringLiteral("cli"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"command", command.toStdString()},
                                  {"error", ex.what()}});
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}

int ReconcileCli::dispatch(const QString &command, const QStringList &args)
{
    if (command == QStringLiteral("info")) {
        return runInfo(args);
    }
    if (command == QStringLiteral("diff")) {
        return runDiff(args);
    }
    if (command == QStringLiteral("apply")) {
        return runApply(args);
    }
    if (command == QStringLiteral("orphans")) {
        return runOrphans(args);
    }
    if (command == QStringLiteral("version")) {
        return runVersion();
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReconcileCli::runInfo(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    const auto reconciler = openReconciler(args);
    if (!reconciler) {
        return 1;
    }

    const ClusterInfo &info = reconciler->info();
    if (format == QStringLiteral("json")) {
        nlohmann::json payload = info;
        payload["environment"] = reconciler->environment().name;
        payload["namespace"] = reconciler->environment().namespaceName;
        payload["diffStrategy"] = reconciler->defaultStrategy();
        std::cout << payload.dump(2) << std::endl;
    } else {
        renderInfoText(info, reconciler->environment(), reconciler->defaultStrategy());
    }
    return 0;
}

int ReconcileCli::runDiff(const QStringList &args)
{
    // Diff compares the manifests file with the cluster through a strategy.
    const auto reconciler = openReconciler(args);
    if (!reconciler) {
        return 1;
    }
    const ManifestList state = loadManifests(args);

    DiffOptions opts;
    opts.strategy = getArgValue(args, QStringLiteral("--strategy")).toStdString();
    opts.summarize = args.contains(QStringLiteral("--summarize"));

    const auto diff = reconciler->diff(state, opts);

    KLOG_INFO(QStringLiteral("ReconcileCli"),
              QStringLiteral("runDiff"),
              QStringLiteral("cli_diff"),
              QStringLiteral("user_invocation"),
              QStringLiteral("diff_strategy"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"manifests", state.size()},
                             {"changed", diff.has_value()}});
    if (!diff.has_value()) {
        std::cerr << "No differences." << std::endl;
        return 0;
    }

    std::cout << *diff;
    if (!diff->empty() && diff->back() != '\n') {
        std::cout << "\n";
    }
    std::cout.flush();
    return 0;
}

int ReconcileCli::runApply(const QStringList &args)
{
    const auto reconciler = openReconciler(args);
    if (!reconciler) {
        return 1;
    }
    const ManifestList state = loadManifests(args);

    ApplyOptions opts;
    opts.force = args.contains(QStringLiteral("--force"));
    opts.autoApprove = args.contains(QStringLiteral("--auto-approve"));

    reconciler->apply(state, opts);
    std::cout << "Applied " << state.size() << " resources." << std::endl;
    return 0;
}

int ReconcileCli::runOrphans(const QStringList &args)
{
    const QString format = getFormat(args);
    if (!validFormat(format)) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    const auto reconciler = openReconciler(args);
    if (!reconciler) {
        return 1;
    }
    const ManifestList state = loadManifests(args);

    std::vector<ResourceIdentifier> ids;
    for (const auto &manifest : reconciler->orphans(state)) {
        ids.push_back(manifest.identifier());
    }
    std::sort(ids.begin(), ids.end());

    if (format == QStringLiteral("json")) {
        std::cout << nlohmann::json(ids).dump(2) << std::endl;
        return 0;
    }

    if (ids.empty()) {
        std::cout << "No orphaned resources." << std::endl;
        return 0;
    }
    for (const auto &id : ids) {
        std::cout << id.toString() << "\n";
    }
    std::cout.flush();
    return 0;
}

int ReconcileCli::runVersion()
{
    std::cout << "krecon " << KRECON_VERSION << std::endl;
    return 0;
}

std::unique_ptr<Reconciler> ReconcileCli::openReconciler(const QStringList &args) const
{
    const QString envPath = getArgValue(args, QStringLiteral("--env"));
    if (envPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return nullptr;
    }
    EnvironmentConfig env = loadEnvironmentFile(envPath);
    logging::setEnvironmentName(QString::fromStdString(env.name));
    return m_factory(env);
}

ManifestList ReconcileCli::loadManifests(const QStringList &args) const
{
    const QString path = getArgValue(args, QStringLiteral("--manifests"));
    if (path.isEmpty()) {
        throw ConfigError("--manifests is required");
    }
    return parseManifestList(readJsonFile(path));
}

} // namespace krecon
