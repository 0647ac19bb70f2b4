#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <QVersionNumber>

#include "common/models.hpp"

namespace krecon {

class ClusterClient;

// Compares the given state with the cluster and returns the differences in
// diff(1) format. std::nullopt means "no differences"; failures are thrown.
using Differ = std::function<std::optional<std::string>(const ManifestList &)>;

constexpr const char kNativeStrategy[] = "native";
constexpr const char kSubsetStrategy[] = "subset";

// Oldest server version whose server-side diff is trusted.
QVersionNumber nativeDiffMinimumVersion();

// "native" from 1.13.0 on, "subset" before.
std::string defaultStrategyFor(const QVersionNumber &serverVersion);

class DiffStrategyRegistry
{
public:
    // native -> client->diffServerSide, subset -> makeSubsetDiffer(client).
    static DiffStrategyRegistry builtin(const std::shared_ptr<ClusterClient> &client);

    // Per-call override wins over the instance default when non-empty.
    static std::string select(const std::string &override,
                              const std::string &instanceDefault);

    void add(const std::string &name, Differ differ);
    bool contains(const std::string &name) const;
    std::vector<std::string> names() const;

    // Throws UnknownStrategy.
    const Differ &resolve(const std::string &name) const;

private:
    std::map<std::string, Differ> m_differs;
};

} // namespace krecon
