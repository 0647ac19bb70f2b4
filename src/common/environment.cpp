#include "common/environment.hpp"

#include <algorithm>
#include <cmath>

#include <QFile>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace krecon {

namespace {

std::string requiredString(const nlohmann::json &obj, const char *key,
                           const std::string &path)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw ConfigError("environment is missing '" + path + "'");
    }
    return it->get<std::string>();
}

const nlohmann::json &requiredObject(const nlohmann::json &obj, const char *key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) {
        throw ConfigError(std::string("environment is missing '") + key + "'");
    }
    return *it;
}

} // namespace

std::string EnvironmentConfig::nameLabel() const
{
    std::string label = name;
    std::replace(label.begin(), label.end(), '/', '.');
    return label;
}

EnvironmentConfig parseEnvironment(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw ConfigError("environment is not a JSON object");
    }

    const std::string kind = document.value("kind", "Environment");
    if (kind != "Environment") {
        throw ConfigError("unexpected document kind '" + kind + "'");
    }

    const nlohmann::json &metadata = requiredObject(document, "metadata");
    const nlohmann::json &spec = requiredObject(document, "spec");

    EnvironmentConfig env;
    env.name = requiredString(metadata, "name", "metadata.name");
    env.apiServer = requiredString(spec, "apiServer", "spec.apiServer");
    env.namespaceName = requiredString(spec, "namespace", "spec.namespace");

    if (spec.contains("diffStrategy")) {
        if (!spec.at("diffStrategy").is_string()) {
            throw ConfigError("'spec.diffStrategy' must be a string");
        }
        env.diffStrategy = spec.at("diffStrategy").get<std::string>();
    }

    if (spec.contains("orphanKinds")) {
        const auto &kinds = spec.at("orphanKinds");
        if (!kinds.is_array()) {
            throw ConfigError("'spec.orphanKinds' must be an array of kind names");
        }
        for (const auto &kind : kinds) {
            if (!kind.is_string() || kind.get<std::string>().empty()) {
                throw ConfigError("'spec.orphanKinds' must be an array of kind names");
            }
            env.orphanKinds.push_back(kind.get<std::string>());
        }
    }

    if (spec.contains("orphanTimeoutSeconds")) {
        const auto &timeout = spec.at("orphanTimeoutSeconds");
        const double seconds = timeout.is_number() ? timeout.get<double>() : 0.0;
        if (!std::isfinite(seconds) || seconds <= 0 || seconds > kMaxOrphanTimeoutSeconds) {
            throw ConfigError("'spec.orphanTimeoutSeconds' must be a number in (0, "
                              + std::to_string(static_cast<int>(kMaxOrphanTimeoutSeconds)) + "]");
        }
        env.orphanTimeout = std::chrono::milliseconds(
            std::max(1LL, static_cast<long long>(std::ceil(seconds * 1000))));
    }

    return env;
}

EnvironmentConfig loadEnvironmentFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw ConfigError("cannot open environment file '" + path.toStdString() + "'");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(file.readAll().toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        throw ConfigError("environment file '" + path.toStdString()
                          + "' is not valid JSON: " + ex.what());
    }

    EnvironmentConfig env = parseEnvironment(document);
    KLOG_DEBUG(QStringLiteral("Environment"),
               QStringLiteral("loadEnvironmentFile"),
               QStringLiteral("environment_loaded"),
               QStringLiteral("command_setup"),
               QStringLiteral("json_file"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", path.toStdString()},
                              {"name", env.name},
                              {"namespace", env.namespaceName}});
    return env;
}

} // namespace krecon
