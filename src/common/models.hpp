#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include <QVersionNumber>

#include <nlohmann/json.hpp>

namespace krecon {

// Names a resource within a cluster independently of its body.
struct ResourceIdentifier {
    std::string kind;
    std::string name;
    std::string namespaceName;

    // Kind/namespace/name, or Kind/name for cluster-scoped resources.
    std::string toString() const;

    bool operator==(const ResourceIdentifier &other) const
    {
        return kind == other.kind && name == other.name
            && namespaceName == other.namespaceName;
    }

    bool operator!=(const ResourceIdentifier &other) const
    {
        return !(*this == other);
    }

    bool operator<(const ResourceIdentifier &other) const;
};

/**
 * Manifest wraps one resource document as handed to, or returned by, the
 * cluster. Only kind and metadata are interpreted; the rest of the body is
 * carried through untouched.
 */
class Manifest
{
public:
    Manifest() = default;

    // Throws InvalidManifest unless the document is an object with a
    // non-empty kind and metadata.name.
    static Manifest fromJson(const nlohmann::json &document);

    std::string kind() const;
    std::string apiVersion() const;
    std::string name() const;
    std::string namespaceName() const;
    std::map<std::string, std::string> labels() const;

    ResourceIdentifier identifier() const;

    const nlohmann::json &raw() const { return m_raw; }

private:
    explicit Manifest(nlohmann::json raw);

    nlohmann::json m_raw = nlohmann::json::object();
};

using ManifestList = std::vector<Manifest>;

struct ClusterInfo {
    QVersionNumber serverVersion;
    std::string gitVersion;
    std::string clusterName;
    std::string apiServer;
    std::string contextName;
};

struct ApplyOptions {
    bool force = false;
    bool autoApprove = false;
};

struct DiffOptions {
    // Reduce the diff to a diffstat(1) histogram.
    bool summarize = false;

    // Overrides the environment's strategy when set.
    std::string strategy;
};

} // namespace krecon

namespace std {

template <>
struct hash<krecon::ResourceIdentifier> {
    size_t operator()(const krecon::ResourceIdentifier &id) const noexcept
    {
        const hash<string> hasher;
        size_t seed = hasher(id.kind);
        seed ^= hasher(id.name) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        seed ^= hasher(id.namespaceName) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        return seed;
    }
};

} // namespace std
