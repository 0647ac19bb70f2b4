#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "client/cluster_client.hpp"
#include "common/errors.hpp"
#include "common/process_utils.hpp"

namespace krecon {

namespace kubectl {

struct KubeContext {
    std::string contextName;
    std::string clusterName;
    std::string server;
};

// Finds the context whose cluster serves `apiServer` in the output of
// `kubectl config view -o json`. Trailing slashes are not significant.
std::optional<KubeContext> findContext(const nlohmann::json &kubeconfig,
                                       const std::string &apiServer);

// Reads serverVersion.gitVersion from `kubectl version -o json`.
// Throws InfoUnavailable when it is absent or not a version.
QVersionNumber parseServerVersion(const nlohmann::json &versionOutput,
                                  std::string *gitVersion = nullptr);

// "k1=v1,k2=v2" in key order.
std::string labelSelector(const std::map<std::string, std::string> &labels);

} // namespace kubectl

// ClusterClient backed by the kubectl binary. Each call runs one kubectl
// process pinned to the context that serves the environment's API server.
class KubectlClient : public ClusterClient
{
public:
    // Throws ClientUnavailable when kubectl cannot be run or no context
    // serves `apiServer`.
    explicit KubectlClient(const std::string &apiServer,
                           const QString &program = QStringLiteral("kubectl"));

    ClusterInfo info() override;
    ManifestList getByLabels(const std::string &namespaceName,
                             const std::string &kind,
                             const std::map<std::string, std::string> &labels,
                             std::optional<std::chrono::milliseconds> timeout) override;
    std::optional<Manifest> get(const std::string &namespaceName,
                                const std::string &kind,
                                const std::string &name) override;
    std::optional<std::string> diffServerSide(const ManifestList &state) override;
    void apply(const ManifestList &state, const ApplyOptions &opts) override;

    const kubectl::KubeContext &context() const { return m_context; }

private:
    ProcessResult run(const QStringList &arguments,
                      const QByteArray &input = QByteArray(),
                      int timeoutMs = -1) const;
    nlohmann::json runJson(const QStringList &arguments, int timeoutMs = -1) const;
    CommandFailed commandError(const QStringList &arguments,
                               const ProcessResult &result) const;

    QString m_program;
    kubectl::KubeContext m_context;
};

} // namespace krecon
