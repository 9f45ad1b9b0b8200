#pragma once

#include <toolwire/mcp/type_spec.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire {

// Schema node for one declared type:
//   integer/number/boolean/string  -> {"type": ...}
//   enum                           -> {"type":"string","enum":[names...]}
//   array                          -> {"type":"array","items":<element>}
//   opaque json                    -> {"type":"object"}
//   record                         -> {"type":"object","properties":{...}}
// `description` is attached when present. Nullability is not expressed.
// Nested records never carry a "required" list; only the top-level input
// schema does.
nlohmann::json BuildTypeSchema(const TypeSpec& type,
                               const std::optional<std::string>& description =
                                   std::nullopt);

// Input schema for a tool:
//   {"type":"object","properties":{...},"required":[...]}
// "required" lists required parameters in declaration order and is omitted
// when no parameter is required.
nlohmann::json BuildInputSchema(const std::vector<ParameterSpec>& parameters);

} // namespace toolwire
