#include <catch2/catch_test_macros.hpp>

#include <toolwire/mcp/mcp_server.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace toolwire;
using nlohmann::json;

namespace {

ServerInfo TestInfo() {
    return ServerInfo{"test-server", "1.2.3", "2024-11-05"};
}

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.RegisterAnnotated(MakeAnnotatedTool(
        "add", "Add two integers", {Param("a"), Param("b")},
        [](int a, int b) { return a + b; }));
    registry.RegisterAnnotated(MakeAnnotatedTool(
        "echo", "Echo the input", {Param("message")},
        [](const std::string& message) { return message; }));
    registry.RegisterAnnotated(MakeAnnotatedTool(
        "explode", "Throw a plain exception", {},
        []() -> std::string { throw std::runtime_error("boom"); }));
    registry.RegisterAnnotated(MakeAnnotatedTool(
        "nothing", "Return an empty optional", {},
        []() { return std::optional<int>(); }));
    return registry;
}

json Request(int id, const std::string& method, json params = nullptr) {
    json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = std::move(params);
    }
    return msg;
}

json ToolCall(int id, const std::string& name, json arguments) {
    return Request(id, "tools/call", {{"name", name}, {"arguments", std::move(arguments)}});
}

std::vector<json> OutputLines(const std::ostringstream& out) {
    std::vector<json> lines;
    std::istringstream output(out.str());
    std::string line;
    while (std::getline(output, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// initialize
// ===========================================================================

TEST_CASE("McpServer: initialize returns server info and capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2025-03-26"}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "test-server");
    CHECK(r["result"]["serverInfo"]["version"] == "1.2.3");
    CHECK(r["result"]["capabilities"]["tools"]["listChanged"] == true);
    CHECK_FALSE(r["result"]["capabilities"].contains("resources"));
}

TEST_CASE("McpServer: initialize advertises resources once a provider is set", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);
    server.SetResourceProvider([]() { return std::vector<ResourceInfo>{}; },
                               [](const std::string&) {
                                   return std::optional<ResourceContent>();
                               });

    auto response = server.HandleMessage(Request(1, "initialize"));
    REQUIRE(response.has_value());
    auto& caps = (*response)["result"]["capabilities"];
    CHECK(caps["resources"]["read"] == true);
    CHECK(caps["resources"]["listChanged"] == true);
}

TEST_CASE("McpServer: initialized notifications produce no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).has_value());
    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "initialized"}}).has_value());
}

TEST_CASE("McpServer: $/ notifications are ignored", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    CHECK_FALSE(server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "$/cancelRequest"}, {"params", {{"id", 3}}}})
                    .has_value());
    CHECK_FALSE(server.HandleMessage(Request(9, "$/progress")).has_value());
}

// ===========================================================================
// tools/list and tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 4);
    CHECK(tools[0]["name"] == "add");
    CHECK(tools[0]["description"] == "Add two integers");
    CHECK(tools[0]["inputSchema"]["required"] == json::array({"a", "b"}));
    CHECK(tools[1]["name"] == "echo");
}

TEST_CASE("McpServer: tools/call wraps the output in text content", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(1, "add", {{"a", 2}, {"b", 3}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["id"] == 1);
    CHECK_FALSE(r.contains("error"));
    auto& content = r["result"]["content"];
    REQUIRE(content.size() == 1);
    CHECK(content[0]["type"] == "text");
    CHECK(content[0]["text"] == "5");
}

TEST_CASE("McpServer: string output is not re-encoded", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(3, "echo", {{"message", "hello world"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["content"][0]["text"] == "hello world");
}

TEST_CASE("McpServer: null tool result renders as null text", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(4, "nothing", json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["content"][0]["text"] == "null");
}

TEST_CASE("McpServer: tools/call without arguments is invalid params", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(Request(5, "tools/call", {{"name", "missing"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["id"] == 5);
}

TEST_CASE("McpServer: tools/call unknown tool is method not found", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(6, "nonexistent", json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Unknown tool: nonexistent");
}

TEST_CASE("McpServer: tools/call missing or non-string name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto missing = server.HandleMessage(Request(7, "tools/call", json::object()));
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32602);

    auto wrong_type = server.HandleMessage(
        Request(8, "tools/call", {{"name", 42}, {"arguments", json::object()}}));
    REQUIRE(wrong_type.has_value());
    CHECK((*wrong_type)["error"]["code"] == -32602);

    auto no_params = server.HandleMessage(Request(9, "tools/call"));
    REQUIRE(no_params.has_value());
    CHECK((*no_params)["error"]["message"] == "Params must be a JSON object");
}

TEST_CASE("McpServer: missing required parameter names it", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(10, "add", {{"a", 2}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Missing required parameter 'b'");
}

TEST_CASE("McpServer: plain exceptions become internal errors", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(11, "explode", json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32603);
    CHECK((*response)["error"]["message"] == "Internal Error: boom");
    CHECK_FALSE((*response)["error"].contains("data"));
}

TEST_CASE("McpServer: non-standard exceptions become internal errors", "[mcp][server]") {
    ToolRegistry registry = MakeTestRegistry();
    registry.Register("throws_int", "Throws a non-exception value", {{"type", "object"}},
                      [](const json&) -> std::string { throw 42; });

    std::string input = ToolCall(1, "throws_int", json::object()).dump() + "\n";
    input += Request(2, "tools/list").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(std::move(registry), TestInfo(), in, out);

    server.Run();

    auto lines = OutputLines(out);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["error"]["code"] == -32603);
    CHECK(lines[0]["error"]["message"] == "Internal Error: unknown exception");
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["tools"].size() == 5);
}

TEST_CASE("McpServer: McpError data is passed through", "[mcp][server]") {
    ToolRegistry registry;
    registry.Register("strict", "Always fails", {{"type", "object"}},
                      [](const json&) -> std::string {
                          throw McpError("quota exceeded", -32001, json{{"limit", 10}});
                      });
    std::istringstream in;
    std::ostringstream out;
    McpServer server(std::move(registry), TestInfo(), in, out);

    auto response = server.HandleMessage(ToolCall(12, "strict", json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32001);
    CHECK((*response)["error"]["message"] == "quota exceeded");
    CHECK((*response)["error"]["data"]["limit"] == 10);
}

// ===========================================================================
// Other methods and envelope rules
// ===========================================================================

TEST_CASE("McpServer: unknown method returns error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(Request(13, "unknown/method"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK((*response)["error"]["message"] == "Method not found: unknown/method");
}

TEST_CASE("McpServer: errors on notifications are still answered, without id", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"method", "bogus/notify"}});
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
    CHECK_FALSE(response->contains("id"));
}

TEST_CASE("McpServer: null id is omitted, string id is echoed", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto null_id = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", nullptr}, {"method", "tools/list"}});
    REQUIRE(null_id.has_value());
    CHECK_FALSE(null_id->contains("id"));

    auto string_id = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", "req-7"}, {"method", "tools/list"}});
    REQUIRE(string_id.has_value());
    CHECK((*string_id)["id"] == "req-7");
}

TEST_CASE("McpServer: message without method is method not found", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 1}});
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
}

// ===========================================================================
// resources
// ===========================================================================

TEST_CASE("McpServer: resources/list without provider is empty", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(Request(1, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["resources"] == json::array());
}

TEST_CASE("McpServer: resources/read without handler", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto response = server.HandleMessage(Request(2, "resources/read", {{"uri", "docs://x"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32002);
}

TEST_CASE("McpServer: resources list and read through the provider", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);
    server.SetResourceProvider(
        []() {
            return std::vector<ResourceInfo>{
                {"docs://readme", "Readme", std::string("text/plain"), std::nullopt}};
        },
        [](const std::string& uri) -> std::optional<ResourceContent> {
            if (uri != "docs://readme") return std::nullopt;
            return ResourceContent{uri, std::string("text/plain"), "read me"};
        });

    auto list = server.HandleMessage(Request(3, "resources/list"));
    REQUIRE(list.has_value());
    auto& resources = (*list)["result"]["resources"];
    REQUIRE(resources.size() == 1);
    CHECK(resources[0]["uri"] == "docs://readme");
    CHECK(resources[0]["mimeType"] == "text/plain");

    auto read = server.HandleMessage(Request(4, "resources/read", {{"uri", "docs://readme"}}));
    REQUIRE(read.has_value());
    auto& contents = (*read)["result"]["contents"];
    REQUIRE(contents.size() == 1);
    CHECK(contents[0]["text"] == "read me");

    auto missing = server.HandleMessage(Request(5, "resources/read", {{"uri", "docs://nope"}}));
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32002);
    CHECK((*missing)["error"]["message"] == "Resource not found: docs://nope");

    auto no_uri = server.HandleMessage(Request(6, "resources/read", json::object()));
    REQUIRE(no_uri.has_value());
    CHECK((*no_uri)["error"]["code"] == -32602);
}

// ===========================================================================
// HandleLine / Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: HandleLine drops malformed and blank lines", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    CHECK_FALSE(server.HandleLine("not json").has_value());
    CHECK_FALSE(server.HandleLine("   ").has_value());
    CHECK_FALSE(server.HandleLine("[1,2,3]").has_value());
    CHECK_FALSE(server.HandleLine("\"just a string\"").has_value());
}

TEST_CASE("McpServer: HandleLine returns compact JSON", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    auto text = server.HandleLine(ToolCall(1, "add", {{"a", 2}, {"b", 3}}).dump());
    REQUIRE(text.has_value());
    CHECK(text->find('\n') == std::string::npos);
    auto parsed = json::parse(*text);
    CHECK(parsed["result"]["content"][0]["text"] == "5");
}

TEST_CASE("McpServer: Run processes multiple messages in order", "[mcp][server]") {
    std::string input;
    input += Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}).dump() + "\n";
    input += json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n";
    input += Request(2, "tools/list").dump() + "\n";
    input += ToolCall(3, "add", {{"a", 2}, {"b", 3}}).dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    server.Run();

    auto lines = OutputLines(out);
    REQUIRE(lines.size() == 3);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[0]["result"]["protocolVersion"] == "2024-11-05");
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[1]["result"]["tools"].size() == 4);
    CHECK(lines[2]["id"] == 3);
    CHECK(lines[2]["result"]["content"][0]["text"] == "5");
}

TEST_CASE("McpServer: Run continues after a malformed line", "[mcp][server]") {
    std::string input = "not json\n";
    input += "\n";
    input += Request(1, "tools/list").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    server.Run();

    auto lines = OutputLines(out);
    REQUIRE(lines.size() == 1);
    CHECK(lines[0]["id"] == 1);
}

TEST_CASE("McpServer: Run on empty input writes nothing", "[mcp][server]") {
    std::istringstream in("");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), TestInfo(), in, out);

    server.Run();
    CHECK(out.str().empty());
}
