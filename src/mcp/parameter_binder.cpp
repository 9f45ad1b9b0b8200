#include <toolwire/mcp/parameter_binder.hpp>

#include <toolwire/mcp/mcp_error.hpp>

namespace toolwire {

std::vector<nlohmann::json> BindArguments(
    const nlohmann::json& arguments,
    const std::vector<ParameterSpec>& parameters) {
    std::vector<nlohmann::json> bound;
    bound.reserve(parameters.size());

    const bool has_object = arguments.is_object();

    for (const auto& param : parameters) {
        if (has_object) {
            auto it = arguments.find(param.name);
            if (it != arguments.end()) {
                try {
                    bound.push_back(DecodeValue(param.type, *it));
                } catch (const DecodeError& e) {
                    throw InvalidParams("Invalid parameter '" + param.name +
                                        "': " + e.what());
                }
                continue;
            }
        }

        if (param.default_value.has_value()) {
            bound.push_back(*param.default_value);
        } else if (param.type.nullable || param.type.IsReferenceLike()) {
            bound.emplace_back(nullptr);
        } else {
            throw InvalidParams("Missing required parameter '" + param.name + "'");
        }
    }

    return bound;
}

} // namespace toolwire
