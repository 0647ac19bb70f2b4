#include "kubernetes/diff_strategy.hpp"

#include <utility>

#include "client/cluster_client.hpp"
#include "common/errors.hpp"
#include "kubernetes/subset_differ.hpp"

namespace krecon {

QVersionNumber nativeDiffMinimumVersion()
{
    return QVersionNumber(1, 13, 0);
}

std::string defaultStrategyFor(const QVersionNumber &serverVersion)
{
    if (serverVersion < nativeDiffMinimumVersion()) {
        return kSubsetStrategy;
    }
    return kNativeStrategy;
}

DiffStrategyRegistry DiffStrategyRegistry::builtin(const std::shared_ptr<ClusterClient> &client)
{
    DiffStrategyRegistry registry;
    registry.add(kNativeStrategy, [client](const ManifestList &state) {
        return client->diffServerSide(state);
    });
    registry.add(kSubsetStrategy, makeSubsetDiffer(client));
    return registry;
}

std::string DiffStrategyRegistry::select(const std::string &override,
                                         const std::string &instanceDefault)
{
    return override.empty() ? instanceDefault : override;
}

void DiffStrategyRegistry::add(const std::string &name, Differ differ)
{
    m_differs[name] = std::move(differ);
}

bool DiffStrategyRegistry::contains(const std::string &name) const
{
    return m_differs.count(name) > 0;
}

std::vector<std::string> DiffStrategyRegistry::names() const
{
    std::vector<std::string> names;
    names.reserve(m_differs.size());
    for (const auto &entry : m_differs) {
        names.push_back(entry.first);
    }
    return names;
}

const Differ &DiffStrategyRegistry::resolve(const std::string &name) const
{
    auto it = m_differs.find(name);
    if (it == m_differs.end()) {
        throw UnknownStrategy(name);
    }
    return it->second;
}

} // namespace krecon
