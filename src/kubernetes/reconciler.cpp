#include "kubernetes/reconciler.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "client/kubectl_client.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "kubernetes/confirm.hpp"
#include "kubernetes/desired_state.hpp"
#include "kubernetes/diff_utils.hpp"
#include "kubernetes/orphan_detector.hpp"

namespace krecon {

Reconciler::Reconciler(EnvironmentConfig env, std::shared_ptr<ClusterClient> client)
    : Reconciler(std::move(env), client, DiffStrategyRegistry::builtin(client))
{
}

Reconciler::Reconciler(EnvironmentConfig env, std::shared_ptr<ClusterClient> client,
                       DiffStrategyRegistry registry)
    : m_env(std::move(env))
    , m_client(std::move(client))
    , m_registry(std::move(registry))
{
    if (!m_client) {
        throw ClientUnavailable("no cluster client for environment '" + m_env.name + "'");
    }

    // Taken once; info() never goes back to the cluster.
    try {
        m_info = m_client->info();
    } catch (const InfoUnavailable &) {
        throw;
    } catch (const std::exception &ex) {
        throw InfoUnavailable(std::string("obtaining cluster info: ") + ex.what());
    }

    m_defaultStrategy = m_env.diffStrategy.empty()
        ? defaultStrategyFor(m_info.serverVersion)
        : m_env.diffStrategy;
    if (!m_registry.contains(m_defaultStrategy)) {
        throw UnknownStrategy(m_defaultStrategy);
    }

    m_confirmer = [](const std::string &message, const std::string &approval) {
        confirm(message, approval, std::cin, std::cout);
    };
    m_summarizer = &diffstat;

    KLOG_INFO(QStringLiteral("Reconciler"),
              QStringLiteral("Reconciler"),
              QStringLiteral("reconciler_ready"),
              QStringLiteral("user_command"),
              QStringLiteral("cluster_info"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"environment", m_env.name},
                             {"serverVersion", m_info.gitVersion},
                             {"context", m_info.contextName},
                             {"diffStrategy", m_defaultStrategy},
                             {"strategyConfigured", !m_env.diffStrategy.empty()}});
}

std::unique_ptr<Reconciler> Reconciler::connect(const EnvironmentConfig &env)
{
    std::shared_ptr<ClusterClient> client;
    try {
        client = std::make_shared<KubectlClient>(env.apiServer);
    } catch (const ClientUnavailable &) {
        throw;
    } catch (const std::exception &ex) {
        throw ClientUnavailable(std::string("creating client: ") + ex.what());
    }
    return std::make_unique<Reconciler>(env, std::move(client));
}

std::optional<std::string> Reconciler::diff(const ManifestList &state,
                                            const DiffOptions &opts) const
{
    const ManifestList desired = normalized(state);
    const std::string strategy = DiffStrategyRegistry::select(opts.strategy, m_defaultStrategy);
    const Differ &differ = m_registry.resolve(strategy);

    KLOG_DEBUG(QStringLiteral("Reconciler"),
               QStringLiteral("diff"),
               QStringLiteral("diff_start"),
               QStringLiteral("user_diff"),
               QString::fromStdString(strategy),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"manifests", desired.size()},
                              {"summarize", opts.summarize}});

    const std::optional<std::string> result = differ(desired);
    if (!result.has_value()) {
        return std::nullopt;
    }

    if (opts.summarize) {
        return m_summarizer(*result);
    }
    return result;
}

void Reconciler::apply(const ManifestList &state, const ApplyOptions &opts)
{
    const ManifestList desired = normalized(state);
    const ManifestList orphaned = scanOrphans(desired);

    if (!opts.autoApprove) {
        m_confirmer(applyMessage(orphaned), "yes");
    }

    KLOG_INFO(QStringLiteral("Reconciler"),
              QStringLiteral("apply"),
              QStringLiteral("apply_start"),
              opts.autoApprove ? QStringLiteral("auto_approved") : QStringLiteral("user_confirmed"),
              QStringLiteral("cluster_apply"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"manifests", desired.size()},
                             {"orphans", orphaned.size()},
                             {"force", opts.force}});
    m_client->apply(desired, opts);
}

ManifestList Reconciler::orphans(const ManifestList &state) const
{
    return scanOrphans(normalized(state));
}

ManifestList Reconciler::normalized(const ManifestList &state) const
{
    return normalizeDesiredState(state, m_env.namespaceName, kEnvironmentLabel, m_env.nameLabel());
}

ManifestList Reconciler::scanOrphans(const ManifestList &desired) const
{
    OrphanQuery query;
    query.namespaceName = m_env.namespaceName;
    query.labels = {{kEnvironmentLabel, m_env.nameLabel()}};
    query.kinds = m_env.orphanKinds.empty() ? defaultOrphanKinds() : m_env.orphanKinds;
    query.timeout = m_env.orphanTimeout;

    return OrphanDetector(m_client).listOrphaned(desired, query);
}

void Reconciler::setConfirmer(Confirmer confirmer)
{
    m_confirmer = std::move(confirmer);
}

void Reconciler::setDiffSummarizer(DiffSummarizer summarizer)
{
    m_summarizer = std::move(summarizer);
}

std::string Reconciler::applyMessage(const ManifestList &orphaned) const
{
    std::string message = "Applying to namespace '" + m_env.namespaceName
        + "' of cluster '" + m_info.clusterName
        + "' at '" + m_info.apiServer
        + "' using context '" + m_info.contextName + "'.";

    if (orphaned.empty()) {
        return message;
    }

    std::vector<std::string> names;
    names.reserve(orphaned.size());
    for (const auto &manifest : orphaned) {
        names.push_back(manifest.identifier().toString());
    }
    std::sort(names.begin(), names.end());

    message += "\n\nThese resources belong to the environment but are not part of it"
               " anymore. They are left untouched:";
    for (const auto &name : names) {
        message += "\n  - " + name;
    }
    return message;
}

} // namespace krecon
