#pragma once

#include <toolwire/mcp/type_spec.hpp>

#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire {

// Resolve one value per parameter, in declaration order:
//   1. argument present       -> DecodeValue(); failure is McpError -32602
//                                "Invalid parameter '<name>': <reason>"
//   2. default declared       -> the default
//   3. nullable/reference-like -> null
//   4. otherwise              -> McpError -32602
//                                "Missing required parameter '<name>'"
// A non-object `arguments` value is treated as an empty object.
std::vector<nlohmann::json> BindArguments(
    const nlohmann::json& arguments,
    const std::vector<ParameterSpec>& parameters);

} // namespace toolwire
