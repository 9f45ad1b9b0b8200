#pragma once

#include <toolwire/mcp/typed_tool.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire {

// A tool invoker takes the raw `arguments` value of a tools/call request and
// returns the tool's output text. Protocol failures are thrown as McpError.
using ToolInvoker = std::function<std::string(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolDefinition: one registered tool.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
    ToolInvoker invoke;
};

// ---------------------------------------------------------------------------
// ToolRegistry: registry of MCP tools.
//
// Filled during startup and read-only while the server loop runs.
// Registering an existing name replaces the entry in place (last
// registration wins, listing position is kept).
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolInvoker invoke);

    // Derive the input schema from the annotated parameters and wrap the
    // callable so it binds raw arguments first.
    void RegisterAnnotated(const AnnotatedTool& tool);
    void RegisterAnnotated(const ToolCatalog& catalog);

    [[nodiscard]] const std::vector<ToolDefinition>& Tools() const noexcept {
        return tools_;
    }

    [[nodiscard]] std::size_t Size() const noexcept { return tools_.size(); }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    // nullptr when no tool has this name.
    [[nodiscard]] const ToolDefinition* Find(const std::string& name) const;

    // {"tools":[{name, description, inputSchema}, ...]} in registration order.
    [[nodiscard]] nlohmann::json ListJson() const;

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace toolwire
