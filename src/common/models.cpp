#include "common/models.hpp"

#include <tuple>
#include <utility>

#include "common/errors.hpp"

namespace krecon {

namespace {

std::string stringField(const nlohmann::json &obj, const char *key)
{
    if (!obj.is_object()) {
        return {};
    }
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return {};
}

const nlohmann::json &metadataOf(const nlohmann::json &document)
{
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = document.find("metadata");
    if (it == document.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

} // namespace

std::string ResourceIdentifier::toString() const
{
    if (namespaceName.empty()) {
        return kind + "/" + name;
    }
    return kind + "/" + namespaceName + "/" + name;
}

bool ResourceIdentifier::operator<(const ResourceIdentifier &other) const
{
    return std::tie(kind, namespaceName, name)
        < std::tie(other.kind, other.namespaceName, other.name);
}

Manifest::Manifest(nlohmann::json raw)
    : m_raw(std::move(raw))
{
}

Manifest Manifest::fromJson(const nlohmann::json &document)
{
    if (!document.is_object()) {
        throw InvalidManifest("manifest is not a JSON object");
    }
    if (stringField(document, "kind").empty()) {
        throw InvalidManifest("manifest has no kind");
    }
    if (stringField(metadataOf(document), "name").empty()) {
        throw InvalidManifest("manifest of kind '" + stringField(document, "kind")
                              + "' has no metadata.name");
    }
    return Manifest(document);
}

std::string Manifest::kind() const
{
    return stringField(m_raw, "kind");
}

std::string Manifest::apiVersion() const
{
    return stringField(m_raw, "apiVersion");
}

std::string Manifest::name() const
{
    return stringField(metadataOf(m_raw), "name");
}

std::string Manifest::namespaceName() const
{
    return stringField(metadataOf(m_raw), "namespace");
}

std::map<std::string, std::string> Manifest::labels() const
{
    std::map<std::string, std::string> labels;
    const nlohmann::json &metadata = metadataOf(m_raw);
    auto it = metadata.find("labels");
    if (it == metadata.end() || !it->is_object()) {
        return labels;
    }
    for (const auto &item : it->items()) {
        if (item.value().is_string()) {
            labels[item.key()] = item.value().get<std::string>();
        }
    }
    return labels;
}

ResourceIdentifier Manifest::identifier() const
{
    return ResourceIdentifier{kind(), name(), namespaceName()};
}

} // namespace krecon
