#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/cluster_client.hpp"
#include "common/models.hpp"

namespace krecon {

// Kinds scanned for orphans unless the environment overrides the list.
// Mirrors the kinds kubectl's apply --prune considers; it is not derived
// from the server's API resource catalog.
const std::vector<std::string> &defaultOrphanKinds();

struct OrphanQuery {
    std::string namespaceName;
    std::map<std::string, std::string> labels;
    std::vector<std::string> kinds;

    // Unset waits for every kind indefinitely. When set, each query is
    // bounded by the remaining time and no worker outlives the scan.
    std::optional<std::chrono::milliseconds> timeout;
};

/**
 * OrphanDetector finds live resources that carry the environment's labels
 * but are absent from the desired state.
 *
 * One worker thread per kind queries the cluster; the calling thread
 * collects exactly one outcome per worker, in arrival order. Every kind is
 * queried even when another one has already failed. If any kind failed the
 * whole scan fails with the last failure observed and nothing is returned.
 */
class OrphanDetector
{
public:
    explicit OrphanDetector(std::shared_ptr<ClusterClient> client);

    // Result order is unspecified. Throws CategoryQueryFailed or
    // OrphanQueryTimeout.
    ManifestList listOrphaned(const ManifestList &desired, const OrphanQuery &query) const;

private:
    std::shared_ptr<ClusterClient> m_client;
};

} // namespace krecon
