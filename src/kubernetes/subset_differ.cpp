#include "kubernetes/subset_differ.hpp"

#include <algorithm>
#include <utility>

#include "common/logging.hpp"
#include "kubernetes/diff_utils.hpp"

namespace krecon {

namespace {

std::string diffLabel(const Manifest &manifest)
{
    std::string label = manifest.apiVersion();
    for (const std::string &part : {manifest.kind(), manifest.namespaceName(), manifest.name()}) {
        if (part.empty()) {
            continue;
        }
        if (!label.empty()) {
            label += ".";
        }
        label += part;
    }
    return label;
}

} // namespace

nlohmann::json subsetOf(const nlohmann::json &live, const nlohmann::json &desired)
{
    if (live.is_object() && desired.is_object()) {
        nlohmann::json result = nlohmann::json::object();
        for (const auto &item : desired.items()) {
            auto it = live.find(item.key());
            if (it == live.end()) {
                continue;
            }
            result[item.key()] = subsetOf(*it, item.value());
        }
        return result;
    }

    if (live.is_array() && desired.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        const std::size_t common = std::min(live.size(), desired.size());
        for (std::size_t i = 0; i < common; ++i) {
            result.push_back(subsetOf(live.at(i), desired.at(i)));
        }
        return result;
    }

    return live;
}

Differ makeSubsetDiffer(std::shared_ptr<ClusterClient> client, TextDiffer textDiffer)
{
    if (!textDiffer) {
        textDiffer = &unifiedDiff;
    }

    return [client = std::move(client), textDiffer = std::move(textDiffer)](
               const ManifestList &state) -> std::optional<std::string> {
        std::string combined;
        bool changed = false;

        for (const auto &manifest : state) {
            const auto live = client->get(manifest.namespaceName(), manifest.kind(),
                                          manifest.name());

            // A missing live object shows up as a full addition.
            const std::string liveText = live.has_value()
                ? subsetOf(live->raw(), manifest.raw()).dump(2) + "\n"
                : std::string();
            const std::string mergedText = manifest.raw().dump(2) + "\n";

            const auto diff = textDiffer(diffLabel(manifest), liveText, mergedText);
            if (!diff.has_value()) {
                continue;
            }
            changed = true;
            combined += *diff;
        }

        KLOG_DEBUG(QStringLiteral("SubsetDiffer"),
                   QStringLiteral("diff"),
                   QStringLiteral("subset_diff_computed"),
                   QStringLiteral("user_diff"),
                   QStringLiteral("field_subset"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"manifests", state.size()},
                                  {"changed", changed}});

        if (!changed) {
            return std::nullopt;
        }
        return combined;
    };
}

} // namespace krecon
