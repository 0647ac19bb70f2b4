#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <QString>

#include <nlohmann/json.hpp>

namespace krecon {

// Label key marking a live resource as a member of an environment.
constexpr const char kEnvironmentLabel[] = "krecon.dev/environment";

// Upper bound for spec.orphanTimeoutSeconds (one day).
constexpr double kMaxOrphanTimeoutSeconds = 86400;

struct EnvironmentConfig {
    std::string name;
    std::string apiServer;
    std::string namespaceName;

    // Empty means: pick by server version.
    std::string diffStrategy;

    // Overrides the built-in catalog of kinds scanned for orphans.
    std::vector<std::string> orphanKinds;

    // Unset means the orphan scan waits for every kind indefinitely.
    std::optional<std::chrono::milliseconds> orphanTimeout;

    // The environment name made safe for use as a label value.
    std::string nameLabel() const;
};

// Parses an Environment document. Throws ConfigError on missing or
// malformed fields.
EnvironmentConfig parseEnvironment(const nlohmann::json &document);

// Reads and parses an environment file. Throws ConfigError.
EnvironmentConfig loadEnvironmentFile(const QString &path);

} // namespace krecon
