#include "client/kubectl_client.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace krecon {

namespace kubectl {

namespace {

std::string trimTrailingSlash(std::string value)
{
    while (!value.empty() && value.back() == '/') {
        value.pop_back();
    }
    return value;
}

std::string nestedString(const nlohmann::json &obj, const char *outer, const char *inner)
{
    auto it = obj.find(outer);
    if (it == obj.end() || !it->is_object()) {
        return {};
    }
    return it->value(inner, "");
}

} // namespace

std::optional<KubeContext> findContext(const nlohmann::json &kubeconfig,
                                       const std::string &apiServer)
{
    if (!kubeconfig.is_object()) {
        return std::nullopt;
    }

    const std::string wanted = trimTrailingSlash(apiServer);
    const nlohmann::json clusters = kubeconfig.value("clusters", nlohmann::json::array());
    const nlohmann::json contexts = kubeconfig.value("contexts", nlohmann::json::array());
    const std::string current = kubeconfig.value("current-context", "");

    std::optional<KubeContext> match;
    for (const auto &cluster : clusters) {
        if (!cluster.is_object()) {
            continue;
        }
        const std::string server = nestedString(cluster, "cluster", "server");
        if (trimTrailingSlash(server) != wanted) {
            continue;
        }
        const std::string clusterName = cluster.value("name", "");

        for (const auto &context : contexts) {
            if (!context.is_object()) {
                continue;
            }
            if (nestedString(context, "context", "cluster") != clusterName) {
                continue;
            }
            KubeContext candidate{context.value("name", ""), clusterName, server};
            // The current context wins if it points at the same cluster.
            if (candidate.contextName == current) {
                return candidate;
            }
            if (!match.has_value()) {
                match = candidate;
            }
        }
    }
    return match;
}

QVersionNumber parseServerVersion(const nlohmann::json &versionOutput,
                                  std::string *gitVersion)
{
    const std::string raw = versionOutput.is_object()
        ? nestedString(versionOutput, "serverVersion", "gitVersion")
        : std::string();
    if (raw.empty()) {
        throw InfoUnavailable("server version missing from 'kubectl version' output");
    }

    QString text = QString::fromStdString(raw);
    if (text.startsWith(QLatin1Char('v'))) {
        text.remove(0, 1);
    }

    // Suffixes such as "-gke.10" or "+k3s1" are ignored.
    const QVersionNumber parsed = QVersionNumber::fromString(text);
    if (parsed.isNull()) {
        throw InfoUnavailable("cannot parse server version '" + raw + "'");
    }

    if (gitVersion) {
        *gitVersion = raw;
    }
    return QVersionNumber(parsed.majorVersion(), parsed.minorVersion(),
                          parsed.microVersion());
}

std::string labelSelector(const std::map<std::string, std::string> &labels)
{
    std::string selector;
    for (const auto &entry : labels) {
        if (!selector.empty()) {
            selector += ",";
        }
        selector += entry.first + "=" + entry.second;
    }
    return selector;
}

} // namespace kubectl

KubectlClient::KubectlClient(const std::string &apiServer, const QString &program)
    : m_program(program)
{
    const QStringList arguments = {QStringLiteral("config"), QStringLiteral("view"),
                                   QStringLiteral("-o"), QStringLiteral("json")};
    const ProcessResult result = runProcess(m_program, arguments);
    if (!result.finished || result.exitCode != 0) {
        throw ClientUnavailable(commandError(arguments, result).what());
    }

    nlohmann::json kubeconfig;
    try {
        kubeconfig = nlohmann::json::parse(result.stdOut.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ClientUnavailable(std::string("cannot parse kubeconfig: ") + ex.what());
    }

    const auto context = kubectl::findContext(kubeconfig, apiServer);
    if (!context.has_value()) {
        throw ClientUnavailable("no context in kubeconfig serves '" + apiServer + "'");
    }
    m_context = *context;

    KLOG_INFO(QStringLiteral("KubectlClient"),
              QStringLiteral("KubectlClient"),
              QStringLiteral("client_ready"),
              QStringLiteral("engine_construction"),
              QStringLiteral("kubeconfig_lookup"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"context", m_context.contextName},
                             {"cluster", m_context.clusterName},
                             {"server", m_context.server}});
}

ClusterInfo KubectlClient::info()
{
    const nlohmann::json output = runJson({QStringLiteral("version"),
                                           QStringLiteral("-o"), QStringLiteral("json")});

    ClusterInfo info;
    info.serverVersion = kubectl::parseServerVersion(output, &info.gitVersion);
    info.clusterName = m_context.clusterName;
    info.apiServer = m_context.server;
    info.contextName = m_context.contextName;
    return info;
}

ManifestList KubectlClient::getByLabels(const std::string &namespaceName,
                                        const std::string &kind,
                                        const std::map<std::string, std::string> &labels,
                                        std::optional<std::chrono::milliseconds> timeout)
{
    QStringList arguments = {QStringLiteral("get"), QString::fromStdString(kind),
                             QStringLiteral("-o"), QStringLiteral("json")};
    if (!labels.empty()) {
        arguments << QStringLiteral("-l")
                  << QString::fromStdString(kubectl::labelSelector(labels));
    }
    if (!namespaceName.empty()) {
        arguments << QStringLiteral("-n") << QString::fromStdString(namespaceName);
    }

    const int timeoutMs = timeout.has_value() ? static_cast<int>(timeout->count()) : -1;
    return parseManifestList(runJson(arguments, timeoutMs));
}

std::optional<Manifest> KubectlClient::get(const std::string &namespaceName,
                                           const std::string &kind,
                                           const std::string &name)
{
    QStringList arguments = {QStringLiteral("get"), QString::fromStdString(kind),
                             QString::fromStdString(name),
                             QStringLiteral("-o"), QStringLiteral("json")};
    if (!namespaceName.empty()) {
        arguments << QStringLiteral("-n") << QString::fromStdString(namespaceName);
    }

    const ProcessResult result = run(arguments);
    if (result.finished && result.exitCode != 0
        && result.stdErr.contains("NotFound")) {
        return std::nullopt;
    }
    if (!result.finished || result.exitCode != 0) {
        throw commandError(arguments, result);
    }

    try {
        return Manifest::fromJson(nlohmann::json::parse(result.stdOut.toStdString()));
    } catch (const nlohmann::json::parse_error &ex) {
        throw CommandFailed(describeCommand(m_program, arguments).toStdString(), 0,
                            std::string("unparseable output: ") + ex.what());
    }
}

std::optional<std::string> KubectlClient::diffServerSide(const ManifestList &state)
{
    const QStringList arguments = {QStringLiteral("diff"), QStringLiteral("-f"),
                                   QStringLiteral("-")};
    const QByteArray input = QByteArray::fromStdString(toKubernetesList(state).dump());

    // kubectl diff exits 1 when differences were found.
    const ProcessResult result = run(arguments, input);
    if (result.finished && result.exitCode == 0) {
        return std::nullopt;
    }
    if (result.finished && result.exitCode == 1) {
        return result.stdOut.toStdString();
    }
    throw commandError(arguments, result);
}

void KubectlClient::apply(const ManifestList &state, const ApplyOptions &opts)
{
    QStringList arguments = {QStringLiteral("apply"), QStringLiteral("-f"),
                             QStringLiteral("-")};
    if (opts.force) {
        arguments << QStringLiteral("--force");
    }
    const QByteArray input = QByteArray::fromStdString(toKubernetesList(state).dump());

    const ProcessResult result = run(arguments, input);
    if (!result.finished || result.exitCode != 0) {
        throw commandError(arguments, result);
    }

    KLOG_INFO(QStringLiteral("KubectlClient"),
              QStringLiteral("apply"),
              QStringLiteral("state_applied"),
              QStringLiteral("user_apply"),
              QStringLiteral("kubectl_apply"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"manifests", state.size()},
                             {"force", opts.force},
                             {"output", result.stdOut.trimmed().toStdString()}});
}

ProcessResult KubectlClient::run(const QStringList &arguments, const QByteArray &input,
                                 int timeoutMs) const
{
    QStringList fullArguments = {QStringLiteral("--context"),
                                 QString::fromStdString(m_context.contextName)};
    fullArguments << arguments;

    if (logging::isTraceEnabled()) {
        KLOG_DEBUG(QStringLiteral("KubectlClient"),
                   QStringLiteral("run"),
                   QStringLiteral("kubectl_invoke"),
                   QStringLiteral("cluster_query"),
                   QStringLiteral("qprocess"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"command",
                                   describeCommand(m_program, fullArguments).toStdString()},
                                  {"timeoutMs", timeoutMs}});
    }
    return runProcess(m_program, fullArguments, input, timeoutMs);
}

nlohmann::json KubectlClient::runJson(const QStringList &arguments, int timeoutMs) const
{
    const ProcessResult result = run(arguments, QByteArray(), timeoutMs);
    if (result.started && !result.finished && timeoutMs >= 0) {
        throw CommandTimedOut(describeCommand(m_program, arguments).toStdString(), timeoutMs);
    }
    if (!result.finished || result.exitCode != 0) {
        throw commandError(arguments, result);
    }

    try {
        return nlohmann::json::parse(result.stdOut.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw CommandFailed(describeCommand(m_program, arguments).toStdString(), 0,
                            std::string("unparseable output: ") + ex.what());
    }
}

CommandFailed KubectlClient::commandError(const QStringList &arguments,
                                          const ProcessResult &result) const
{
    const int exitCode = result.finished ? result.exitCode : -1;
    return CommandFailed(describeCommand(m_program, arguments).toStdString(), exitCode,
                         result.stdErr.trimmed().toStdString());
}

} // namespace krecon
