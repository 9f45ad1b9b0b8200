#pragma once

#include <toolwire/mcp/tool_registry.hpp>
#include <toolwire/mcp/typed_tool.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace toolwire {

// ---------------------------------------------------------------------------
// Types used by the built-in tools.
// ---------------------------------------------------------------------------
struct Point {
    double x = 0.0;
    double y = 0.0;
};

struct Shape {
    std::string name;
    Point center_point;
    std::vector<Point> vertices;
    std::optional<std::string> label;
};

struct ShapeSummary {
    std::string name;
    int vertex_count = 0;
    double perimeter = 0.0;
    Point center_point;
    std::optional<std::string> label;
};

enum class Color { Red, Green, Blue };

template <>
struct RecordTraits<Point> {
    static auto Fields() {
        return std::make_tuple(Field("x", &Point::x, "Horizontal coordinate"),
                               Field("y", &Point::y, "Vertical coordinate"));
    }
};

template <>
struct RecordTraits<Shape> {
    static auto Fields() {
        return std::make_tuple(Field("name", &Shape::name),
                               Field("center_point", &Shape::center_point),
                               Field("vertices", &Shape::vertices),
                               Field("label", &Shape::label, "Optional caption"));
    }
};

template <>
struct RecordTraits<ShapeSummary> {
    static auto Fields() {
        return std::make_tuple(Field("name", &ShapeSummary::name),
                               Field("vertex_count", &ShapeSummary::vertex_count),
                               Field("perimeter", &ShapeSummary::perimeter),
                               Field("center_point", &ShapeSummary::center_point),
                               Field("label", &ShapeSummary::label));
    }
};

template <>
struct EnumTraits<Color> {
    static const std::vector<std::pair<Color, const char*>>& Values() {
        static const std::vector<std::pair<Color, const char*>> values = {
            {Color::Red, "Red"}, {Color::Green, "Green"}, {Color::Blue, "Blue"}};
        return values;
    }
};

// Registration table of the tools shipped with the toolwire executable.
ToolCatalog BuiltinToolCatalog();

// Register every tool of BuiltinToolCatalog().
void RegisterBuiltinTools(ToolRegistry& registry);

} // namespace toolwire
