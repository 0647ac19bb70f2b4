#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "client/cluster_client.hpp"
#include "kubernetes/diff_strategy.hpp"

namespace krecon {

// Renders the difference between two texts of one resource;
// std::nullopt when equal. unifiedDiff() is the production renderer.
using TextDiffer = std::function<std::optional<std::string>(
    const std::string &label, const std::string &live, const std::string &merged)>;

/**
 * Restricts `live` to the fields that also appear in `desired`:
 * - objects keep only keys present on both sides, recursively;
 * - arrays are compared element by element over their common length;
 * - scalars, and values whose type differs, keep the live value.
 * Fields the server manages (status, injected defaults) therefore drop out.
 */
nlohmann::json subsetOf(const nlohmann::json &live, const nlohmann::json &desired);

// The "subset" strategy for servers without server-side diff.
Differ makeSubsetDiffer(std::shared_ptr<ClusterClient> client,
                        TextDiffer textDiffer = TextDiffer());

} // namespace krecon
