#include <toolwire/mcp/tool_registry.hpp>

#include <toolwire/mcp/parameter_binder.hpp>
#include <toolwire/mcp/schema_mapper.hpp>

namespace toolwire {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolInvoker invoke) {
    ToolDefinition definition{name, description, input_schema, std::move(invoke)};

    auto it = index_.find(name);
    if (it != index_.end()) {
        tools_[it->second] = std::move(definition);
        return;
    }
    index_.emplace(name, tools_.size());
    tools_.push_back(std::move(definition));
}

void ToolRegistry::RegisterAnnotated(const AnnotatedTool& tool) {
    auto schema = BuildInputSchema(tool.parameters);
    Register(tool.name, tool.description, schema,
             [parameters = tool.parameters, invoke = tool.invoke](
                 const nlohmann::json& arguments) {
                 return invoke(BindArguments(arguments, parameters));
             });
}

void ToolRegistry::RegisterAnnotated(const ToolCatalog& catalog) {
    for (const auto& tool : catalog) {
        RegisterAnnotated(tool);
    }
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return index_.count(name) > 0;
}

const ToolDefinition* ToolRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

nlohmann::json ToolRegistry::ListJson() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return {{"tools", std::move(tools)}};
}

} // namespace toolwire
