#include <toolwire/mcp/resource_provider.hpp>

#include <toolwire/core/log.hpp>

#include <fstream>
#include <sstream>

namespace toolwire {

nlohmann::json ResourceInfo::ToJson() const {
    nlohmann::json j = {{"uri", uri}, {"name", name}};
    if (mime_type.has_value()) j["mimeType"] = *mime_type;
    if (description.has_value()) j["description"] = *description;
    return j;
}

nlohmann::json ResourceContent::ToJson() const {
    nlohmann::json j = {{"uri", uri}};
    if (mime_type.has_value()) j["mimeType"] = *mime_type;
    j["text"] = text;
    return j;
}

StaticResourceTable::StaticResourceTable(std::vector<ResourceEntry> entries)
    : entries_(std::move(entries)) {}

std::vector<ResourceInfo> StaticResourceTable::List() const {
    std::vector<ResourceInfo> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back({entry.uri, entry.name, entry.mime_type, entry.description});
    }
    return out;
}

std::optional<ResourceContent> StaticResourceTable::Read(
    const std::string& uri) const {
    for (const auto& entry : entries_) {
        if (entry.uri != uri) continue;

        std::ifstream file(entry.path, std::ios::in | std::ios::binary);
        if (!file) {
            LogWarn("resources", "Cannot open '" + entry.path + "' for " + uri);
            return std::nullopt;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        return ResourceContent{entry.uri, entry.mime_type, buffer.str()};
    }
    return std::nullopt;
}

} // namespace toolwire
