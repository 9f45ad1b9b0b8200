#pragma once

#include <toolwire/mcp/resource_provider.hpp>
#include <toolwire/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace toolwire {

// Identity reported in the initialize handshake.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
};

// ---------------------------------------------------------------------------
// McpServer: MCP server over a line-delimited JSON-RPC 2.0 stream.
//
// Methods:
//   - initialize
//   - notifications/initialized (notification, no response)
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - "$/..." notifications are ignored
//
// One line is decoded, handled and answered before the next is read.
// Malformed lines are logged and dropped without a response. A response is
// written whenever handling produced a result or an error, whether or not
// the request carried an id.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry,
              ServerInfo info,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Enables resources/list and resources/read and advertises the
    // resources capability.
    void SetResourceProvider(ResourceLister list, ResourceReader read);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process one input line and return the serialized response (without
    // the trailing newline), if any.
    [[nodiscard]] std::optional<std::string> HandleLine(const std::string& line);

    // Process a single decoded JSON-RPC message and return the response (if
    // any).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const ToolRegistry& Registry() const noexcept {
        return registry_;
    }

private:
    // Returns null when the method produces no response.
    nlohmann::json Route(const std::string& method, const nlohmann::json& params);

    nlohmann::json HandleInitialize() const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params);
    nlohmann::json HandleResourcesList() const;
    nlohmann::json HandleResourcesRead(const nlohmann::json& params) const;

    static nlohmann::json MakeResponse(const nlohmann::json& id,
                                       const nlohmann::json& result,
                                       const std::optional<nlohmann::json>& error);

    ToolRegistry registry_;
    ServerInfo info_;
    ResourceLister list_resources_;
    ResourceReader read_resource_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace toolwire
