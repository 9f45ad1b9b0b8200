#include <toolwire/mcp/builtin_tools.hpp>

#include <toolwire/mcp/mcp_error.hpp>

#include <cmath>
#include <cstdint>
#include <future>
#include <limits>
#include <numeric>

namespace toolwire {

namespace {

int Add(int a, int b) {
    const std::int64_t sum = static_cast<std::int64_t>(a) + b;
    if (sum < std::numeric_limits<int>::min() ||
        sum > std::numeric_limits<int>::max()) {
        throw InvalidParams("sum overflows int");
    }
    return static_cast<int>(sum);
}

std::string Echo(const std::string& message) {
    return message;
}

double Sum(const std::vector<double>& values) {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

std::string Repeat(const std::string& text, int times,
                   const std::optional<std::string>& separator) {
    if (times < 0) {
        throw InvalidParams("'times' must not be negative");
    }
    std::string out;
    for (int i = 0; i < times; ++i) {
        if (i > 0 && separator) out += *separator;
        out += text;
    }
    return out;
}

ShapeSummary DescribeShape(const Shape& shape) {
    ShapeSummary summary;
    summary.name = shape.name;
    summary.vertex_count = static_cast<int>(shape.vertices.size());
    summary.center_point = shape.center_point;
    summary.label = shape.label;

    const auto n = shape.vertices.size();
    if (n > 1) {
        for (size_t i = 0; i < n; ++i) {
            const auto& a = shape.vertices[i];
            const auto& b = shape.vertices[(i + 1) % n];
            summary.perimeter += std::hypot(b.x - a.x, b.y - a.y);
        }
    }
    return summary;
}

std::string Paint(Color color) {
    return std::string("Painted ") + detail::EnumName(color);
}

nlohmann::json Inspect(const nlohmann::json& payload) {
    nlohmann::json report = {{"type", payload.type_name()}};
    if (payload.is_object() || payload.is_array()) {
        report["size"] = payload.size();
    }
    return report;
}

void Ping() {}

std::future<std::string> DelayedGreeting(const std::string& name) {
    return std::async(std::launch::deferred,
                      [name]() { return "Hello, " + name + "!"; });
}

void Fail(const std::string& message) {
    throw McpError(message, rpc_error::kToolFailure, nlohmann::json{{"tool", "fail"}});
}

} // anonymous namespace

ToolCatalog BuiltinToolCatalog() {
    return {
        MakeAnnotatedTool("add", "Add two integers",
                          {Param("a", "First addend"), Param("b", "Second addend")},
                          &Add),
        MakeAnnotatedTool("echo", "Return the message unchanged",
                          {Param("message")}, &Echo),
        MakeAnnotatedTool("sum", "Sum a list of numbers",
                          {Param("values", "Numbers to add up")}, &Sum),
        MakeAnnotatedTool("repeat", "Repeat a text several times",
                          {Param("text"),
                           Param("times", "How many copies").Default(2),
                           Param("separator").Require(false)},
                          &Repeat),
        MakeAnnotatedTool("describe_shape",
                          "Summarize a polygon: vertex count and perimeter",
                          {Param("shape", "Polygon to describe")}, &DescribeShape),
        MakeAnnotatedTool("paint", "Paint with one of the supported colors",
                          {Param("color")}, &Paint),
        MakeAnnotatedTool("inspect", "Report the JSON type of an arbitrary payload",
                          {Param("payload")}, &Inspect),
        MakeAnnotatedTool("ping", "Check that the server answers", {}, &Ping),
        MakeAnnotatedTool("delayed_greeting",
                          "Greet someone once a deferred computation completes",
                          {Param("name")}, &DelayedGreeting),
        MakeAnnotatedTool("fail", "Fail with a protocol error carrying data",
                          {Param("message")}, &Fail),
    };
}

void RegisterBuiltinTools(ToolRegistry& registry) {
    registry.RegisterAnnotated(BuiltinToolCatalog());
}

} // namespace toolwire
