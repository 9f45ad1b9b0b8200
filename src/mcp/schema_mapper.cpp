#include <toolwire/mcp/schema_mapper.hpp>

namespace toolwire {

nlohmann::json BuildTypeSchema(const TypeSpec& type,
                               const std::optional<std::string>& description) {
    nlohmann::json schema = nlohmann::json::object();
    if (description.has_value()) {
        schema["description"] = *description;
    }

    switch (type.kind) {
        case TypeKind::String:
            schema["type"] = "string";
            break;
        case TypeKind::Integer:
            schema["type"] = "integer";
            break;
        case TypeKind::Number:
            schema["type"] = "number";
            break;
        case TypeKind::Boolean:
            schema["type"] = "boolean";
            break;
        case TypeKind::Enum:
            schema["type"] = "string";
            schema["enum"] = type.enum_names;
            break;
        case TypeKind::Array:
            schema["type"] = "array";
            schema["items"] = type.items ? BuildTypeSchema(*type.items)
                                         : nlohmann::json{{"type", "object"}};
            break;
        case TypeKind::Json:
            schema["type"] = "object";
            break;
        case TypeKind::Record: {
            schema["type"] = "object";
            nlohmann::json properties = nlohmann::json::object();
            for (const auto& field : type.fields) {
                properties[ToCamelCase(field.name)] =
                    BuildTypeSchema(field.type, field.description);
            }
            schema["properties"] = std::move(properties);
            break;
        }
    }
    return schema;
}

nlohmann::json BuildInputSchema(const std::vector<ParameterSpec>& parameters) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();

    for (const auto& param : parameters) {
        if (param.IsRequired()) {
            required.push_back(param.name);
        }
        properties[param.name] = BuildTypeSchema(param.type, param.description);
    }

    nlohmann::json schema = {
        {"type", "object"},
        {"properties", std::move(properties)},
    };
    if (!required.empty()) {
        schema["required"] = std::move(required);
    }
    return schema;
}

} // namespace toolwire
