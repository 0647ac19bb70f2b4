#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "client/cluster_client.hpp"
#include "common/environment.hpp"
#include "common/models.hpp"
#include "kubernetes/diff_strategy.hpp"

namespace krecon {

// Shows `message` and requires the user to type `approval`.
// Throws NotConfirmed otherwise.
using Confirmer = std::function<void(const std::string &message, const std::string &approval)>;

// Reduces diff text to a summary; diffstat() in production.
using DiffSummarizer = std::function<std::string(const std::string &diffText)>;

/**
 * Reconciler compares and pushes an environment's desired state to its
 * cluster. It is the single entry point used by the command line:
 * - diff() routes to a named diff strategy;
 * - apply() lists orphans, asks for confirmation and applies;
 * - orphans() lists labelled live resources missing from desired state;
 * - info() returns the cluster snapshot taken at construction.
 *
 * Every entry point works on the normalized desired state, see
 * normalizeDesiredState().
 */
class Reconciler
{
public:
    // Throws ClientUnavailable for a null client and InfoUnavailable when the
    // cluster info cannot be read. The built-in strategies are registered.
    Reconciler(EnvironmentConfig env, std::shared_ptr<ClusterClient> client);
    Reconciler(EnvironmentConfig env, std::shared_ptr<ClusterClient> client,
               DiffStrategyRegistry registry);

    // Builds a kubectl-backed client for env.apiServer.
    static std::unique_ptr<Reconciler> connect(const EnvironmentConfig &env);

    std::optional<std::string> diff(const ManifestList &state, const DiffOptions &opts) const;
    void apply(const ManifestList &state, const ApplyOptions &opts);
    ManifestList orphans(const ManifestList &state) const;

    const ClusterInfo &info() const { return m_info; }
    const EnvironmentConfig &environment() const { return m_env; }
    const std::string &defaultStrategy() const { return m_defaultStrategy; }

    void setConfirmer(Confirmer confirmer);
    void setDiffSummarizer(DiffSummarizer summarizer);

private:
    // Fills in the environment's namespace and label.
    ManifestList normalized(const ManifestList &state) const;
    ManifestList scanOrphans(const ManifestList &desired) const;
    std::string applyMessage(const ManifestList &orphaned) const;

    EnvironmentConfig m_env;
    std::shared_ptr<ClusterClient> m_client;
    ClusterInfo m_info;
    DiffStrategyRegistry m_registry;
    std::string m_defaultStrategy;

    Confirmer m_confirmer;
    DiffSummarizer m_summarizer;
};

} // namespace krecon
