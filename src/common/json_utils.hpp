#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace krecon {

inline void to_json(nlohmann::json &j, const ResourceIdentifier &id)
{
    j = nlohmann::json{
        {"kind", id.kind},
        {"name", id.name},
        {"namespace", id.namespaceName}
    };
}

inline void from_json(const nlohmann::json &j, ResourceIdentifier &id)
{
    id.kind = j.value("kind", "");
    id.name = j.value("name", "");
    id.namespaceName = j.value("namespace", "");
}

inline void to_json(nlohmann::json &j, const Manifest &manifest)
{
    j = manifest.raw();
}

inline void from_json(const nlohmann::json &j, Manifest &manifest)
{
    manifest = Manifest::fromJson(j);
}

inline void to_json(nlohmann::json &j, const ClusterInfo &info)
{
    j = nlohmann::json{
        {"serverVersion", info.serverVersion.toString().toStdString()},
        {"gitVersion", info.gitVersion},
        {"cluster", nlohmann::json{
            {"name", info.clusterName},
            {"server", info.apiServer}
        }},
        {"context", info.contextName}
    };
}

// Accepts a JSON array of manifests, a Kubernetes List (an object with an
// "items" array, as `kubectl get -o json` prints it) or a single manifest.
inline ManifestList parseManifestList(const nlohmann::json &document)
{
    ManifestList list;
    const nlohmann::json *items = nullptr;
    if (document.is_array()) {
        items = &document;
    } else if (document.is_object() && document.contains("items")) {
        items = &document.at("items");
        if (!items->is_array()) {
            throw InvalidManifest("'items' is not an array");
        }
    }

    if (!items) {
        if (document.is_null()) {
            return list;
        }
        list.push_back(Manifest::fromJson(document));
        return list;
    }

    list.reserve(items->size());
    for (const auto &item : *items) {
        list.push_back(Manifest::fromJson(item));
    }
    return list;
}

inline nlohmann::json toKubernetesList(const ManifestList &list)
{
    nlohmann::json items = nlohmann::json::array();
    for (const auto &manifest : list) {
        items.push_back(manifest.raw());
    }
    return nlohmann::json{
        {"apiVersion", "v1"},
        {"kind", "List"},
        {"items", items}
    };
}

} // namespace krecon
