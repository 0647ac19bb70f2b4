#pragma once

#include <string>

#include "common/models.hpp"

namespace krecon {

// True for kinds the API server stores outside any namespace.
bool isClusterScoped(const std::string &kind);

/**
 * Brings a desired state in line with what the cluster will report once it
 * is applied:
 * - namespaced objects without metadata.namespace get `namespaceName`;
 * - objects without the `labelKey` label are stamped with `labelValue`.
 *
 * Throws InvalidManifest for an object whose `labelKey` label names another
 * environment. The input is not modified.
 */
ManifestList normalizeDesiredState(const ManifestList &state,
                                   const std::string &namespaceName,
                                   const std::string &labelKey,
                                   const std::string &labelValue);

} // namespace krecon
