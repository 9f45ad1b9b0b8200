#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire {

// Entry of resources/list.
struct ResourceInfo {
    std::string uri;
    std::string name;
    std::optional<std::string> mime_type;
    std::optional<std::string> description;

    // {uri, name, mimeType?, description?}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// Entry of resources/read "contents".
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;

    // {uri, mimeType?, text}
    [[nodiscard]] nlohmann::json ToJson() const;
};

using ResourceLister = std::function<std::vector<ResourceInfo>()>;

// std::nullopt when the URI is unknown.
using ResourceReader =
    std::function<std::optional<ResourceContent>(const std::string& uri)>;

// A configured resource backed by a file on disk.
struct ResourceEntry {
    std::string uri;
    std::string name;
    std::optional<std::string> mime_type;
    std::optional<std::string> description;
    std::string path;
};

// ---------------------------------------------------------------------------
// StaticResourceTable: the list/read callback pair over a fixed set of
// file-backed resources. Files are read on every resources/read, so edits on
// disk show up without a restart.
// ---------------------------------------------------------------------------
class StaticResourceTable {
public:
    explicit StaticResourceTable(std::vector<ResourceEntry> entries);

    [[nodiscard]] std::vector<ResourceInfo> List() const;
    [[nodiscard]] std::optional<ResourceContent> Read(const std::string& uri) const;

    [[nodiscard]] bool Empty() const noexcept { return entries_.empty(); }

private:
    std::vector<ResourceEntry> entries_;
};

} // namespace toolwire
