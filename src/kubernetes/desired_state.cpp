#include "kubernetes/desired_state.hpp"

#include <unordered_set>

#include "common/errors.hpp"

namespace krecon {

bool isClusterScoped(const std::string &kind)
{
    static const std::unordered_set<std::string> kinds = {
        "APIService",
        "CertificateSigningRequest",
        "ClusterRole",
        "ClusterRoleBinding",
        "CSIDriver",
        "CSINode",
        "CustomResourceDefinition",
        "IngressClass",
        "MutatingWebhookConfiguration",
        "Namespace",
        "Node",
        "PersistentVolume",
        "PodSecurityPolicy",
        "PriorityClass",
        "RuntimeClass",
        "StorageClass",
        "ValidatingWebhookConfiguration",
        "VolumeAttachment",
    };
    return kinds.count(kind) > 0;
}

ManifestList normalizeDesiredState(const ManifestList &state,
                                   const std::string &namespaceName,
                                   const std::string &labelKey,
                                   const std::string &labelValue)
{
    ManifestList normalized;
    normalized.reserve(state.size());

    for (const auto &manifest : state) {
        const auto labels = manifest.labels();
        auto label = labels.find(labelKey);
        if (label != labels.end() && label->second != labelValue) {
            throw InvalidManifest(manifest.identifier().toString() + " is labelled "
                                  + labelKey + "=" + label->second
                                  + ", not " + labelValue);
        }

        nlohmann::json document = manifest.raw();
        nlohmann::json &metadata = document["metadata"];
        if (manifest.namespaceName().empty() && !isClusterScoped(manifest.kind())) {
            metadata["namespace"] = namespaceName;
        }
        if (label == labels.end()) {
            if (!metadata.contains("labels") || !metadata["labels"].is_object()) {
                metadata["labels"] = nlohmann::json::object();
            }
            metadata["labels"][labelKey] = labelValue;
        }

        normalized.push_back(Manifest::fromJson(document));
    }
    return normalized;
}

} // namespace krecon
