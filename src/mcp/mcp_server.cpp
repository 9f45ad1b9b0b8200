#include <toolwire/mcp/mcp_server.hpp>

#include <toolwire/core/log.hpp>
#include <toolwire/mcp/mcp_error.hpp>

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

namespace toolwire {

namespace {

constexpr const char* kComponent = "mcp";

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool StartsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string Serialize(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     ServerInfo info,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), info_(std::move(info)), in_(in), out_(out) {}

void McpServer::SetResourceProvider(ResourceLister list, ResourceReader read) {
    list_resources_ = std::move(list);
    read_resource_ = std::move(read);
}

void McpServer::Run() {
    LogInfo(kComponent, "=== " + info_.name + " " + info_.version +
                            " started (" + std::to_string(registry_.Size()) +
                            " tools) ===");
    try {
        std::string line;
        while (std::getline(in_, line)) {
            auto response = HandleLine(line);
            if (response) {
                out_ << *response << '\n';
                out_.flush();
            }
        }
    } catch (const std::exception& e) {
        LogError(kComponent, std::string("Session loop failed: ") + e.what());
    }
    LogInfo(kComponent, "Input closed, server loop finished");
}

std::optional<std::string> McpServer::HandleLine(const std::string& line) {
    if (IsBlank(line)) return std::nullopt;

    const bool trace = GlobalLogger().IsEnabled(LogLevel::Debug);
    if (trace) LogDebug(kComponent, "[RECV]: " + line);

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        // The id of a malformed line cannot be recovered, so no reply.
        LogWarn(kComponent, std::string("[JSON ERROR]: ") + e.what());
        return std::nullopt;
    }
    if (!message.is_object()) {
        LogWarn(kComponent, "[JSON ERROR]: request is not a JSON object");
        return std::nullopt;
    }

    auto response = HandleMessage(message);
    if (!response) return std::nullopt;

    auto text = Serialize(*response);
    if (trace) LogDebug(kComponent, "[SEND]: " + text);
    return text;
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    std::string method;
    nlohmann::json params;
    nlohmann::json id;
    if (message.is_object()) {
        auto method_it = message.find("method");
        if (method_it != message.end() && method_it->is_string()) {
            method = method_it->get<std::string>();
        }
        auto params_it = message.find("params");
        if (params_it != message.end()) params = *params_it;
        auto id_it = message.find("id");
        if (id_it != message.end()) id = *id_it;
    }

    nlohmann::json result;
    std::optional<nlohmann::json> error;
    try {
        result = Route(method, params);
    } catch (const McpError& e) {
        LogWarn(kComponent, std::string("[MCP ERROR]: ") + e.what());
        error = e.ToJson();
    } catch (const std::exception& e) {
        LogError(kComponent, "[INTERNAL ERROR] " + method + ": " + e.what());
        error = McpError(std::string("Internal Error: ") + e.what(),
                         rpc_error::kInternalError).ToJson();
    } catch (...) {
        LogError(kComponent, "[INTERNAL ERROR] " + method + ": unknown exception");
        error = McpError("Internal Error: unknown exception",
                         rpc_error::kInternalError).ToJson();
    }

    if (result.is_null() && !error) {
        return std::nullopt;
    }
    return MakeResponse(id, result, error);
}

nlohmann::json McpServer::Route(const std::string& method,
                                const nlohmann::json& params) {
    if (method == "initialize") {
        return HandleInitialize();
    }
    if (method == "notifications/initialized" || method == "initialized") {
        return nullptr;
    }
    if (method == "tools/list") {
        return registry_.ListJson();
    }
    if (method == "tools/call") {
        return HandleToolsCall(params);
    }
    if (method == "resources/list") {
        return HandleResourcesList();
    }
    if (method == "resources/read") {
        return HandleResourcesRead(params);
    }
    if (StartsWith(method, "$/")) {
        return nullptr;
    }
    throw MethodNotFound("Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize() const {
    nlohmann::json capabilities = {
        {"tools", {{"listChanged", true}}}
    };
    if (list_resources_ || read_resource_) {
        capabilities["resources"] = {{"listChanged", true}, {"read", true}};
    }

    return {
        {"protocolVersion", info_.protocol_version},
        {"capabilities", capabilities},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params) {
    if (!params.is_object()) {
        throw InvalidParams("Params must be a JSON object");
    }

    auto name_it = params.find("name");
    if (name_it == params.end()) {
        throw InvalidParams("Missing 'name' in tool call params");
    }
    if (!name_it->is_string()) {
        throw InvalidParams("'name' in tool call params must be a string");
    }
    const auto tool_name = name_it->get<std::string>();

    auto args_it = params.find("arguments");
    if (args_it == params.end()) {
        throw InvalidParams("Missing 'arguments' in tool call params");
    }

    const auto* tool = registry_.Find(tool_name);
    if (tool == nullptr) {
        throw MethodNotFound("Unknown tool: " + tool_name);
    }

    LogDebug(kComponent, "Calling tool '" + tool_name + "'");
    auto output = tool->invoke(*args_it);

    return {
        {"content", nlohmann::json::array({
            {{"type", "text"}, {"text", std::move(output)}}
        })}
    };
}

nlohmann::json McpServer::HandleResourcesList() const {
    nlohmann::json resources = nlohmann::json::array();
    if (list_resources_) {
        for (const auto& info : list_resources_()) {
            resources.push_back(info.ToJson());
        }
    }
    return {{"resources", std::move(resources)}};
}

nlohmann::json McpServer::HandleResourcesRead(const nlohmann::json& params) const {
    if (!params.is_object() || !params.contains("uri") ||
        !params["uri"].is_string()) {
        throw InvalidParams("Missing 'uri' in resources/read params");
    }
    const auto uri = params["uri"].get<std::string>();

    if (!read_resource_) {
        throw McpError("No resource handler registered",
                       rpc_error::kResourceNotFound);
    }

    auto content = read_resource_(uri);
    if (!content) {
        throw McpError("Resource not found: " + uri,
                       rpc_error::kResourceNotFound);
    }

    return {{"contents", nlohmann::json::array({content->ToJson()})}};
}

nlohmann::json McpServer::MakeResponse(const nlohmann::json& id,
                                       const nlohmann::json& result,
                                       const std::optional<nlohmann::json>& error) {
    nlohmann::json response = {{"jsonrpc", "2.0"}};
    if (error) {
        response["error"] = *error;
    } else {
        response["result"] = result;
    }
    if (!id.is_null()) {
        response["id"] = id;
    }
    return response;
}

} // namespace toolwire
