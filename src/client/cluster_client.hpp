#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace krecon {

/**
 * ClusterClient is the boundary to the orchestrator's API. Implementations
 * report failures by throwing KreconError subclasses.
 *
 * getByLabels() and get() are called concurrently from orphan-scan workers,
 * so implementations must tolerate parallel read calls.
 */
class ClusterClient
{
public:
    virtual ~ClusterClient() = default;

    virtual ClusterInfo info() = 0;

    // Lists resources of one kind carrying every given label. With a timeout
    // the call gives up by then and throws CommandTimedOut.
    virtual ManifestList getByLabels(const std::string &namespaceName,
                                     const std::string &kind,
                                     const std::map<std::string, std::string> &labels,
                                     std::optional<std::chrono::milliseconds> timeout) = 0;

    // Fetches a single live object; std::nullopt when it does not exist.
    virtual std::optional<Manifest> get(const std::string &namespaceName,
                                        const std::string &kind,
                                        const std::string &name) = 0;

    // Server-side diff of the given state; std::nullopt when nothing differs.
    virtual std::optional<std::string> diffServerSide(const ManifestList &state) = 0;

    virtual void apply(const ManifestList &state, const ApplyOptions &opts) = 0;
};

} // namespace krecon
