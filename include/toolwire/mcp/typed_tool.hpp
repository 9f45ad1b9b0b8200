#pragma once

#include <toolwire/mcp/mcp_error.hpp>
#include <toolwire/mcp/type_spec.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace toolwire {

// ---------------------------------------------------------------------------
// Registration table hooks.
//
// Records: specialize RecordTraits<T> with a static Fields() returning a
// tuple of Field(...) descriptors, in declaration order:
//
//   template <> struct RecordTraits<Point> {
//       static auto Fields() {
//           return std::make_tuple(Field("x", &Point::x),
//                                  Field("y", &Point::y, "Vertical offset"));
//       }
//   };
//
// Enums: specialize EnumTraits<E> with a static Values() listing every
// (value, symbolic name) pair.
// ---------------------------------------------------------------------------
template <typename T>
struct RecordTraits {};

template <typename E>
struct EnumTraits {};

template <typename T, typename M>
struct FieldDescriptor {
    using record_type = T;
    using member_type = M;

    const char* name;
    M T::*member;
    const char* description;
};

template <typename T, typename M>
FieldDescriptor<T, M> Field(const char* name, M T::*member,
                            const char* description = nullptr) {
    return FieldDescriptor<T, M>{name, member, description};
}

namespace detail {

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename T>
struct always_false : std::false_type {};

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
struct is_vector : std::false_type {};
template <typename T, typename A>
struct is_vector<std::vector<T, A>> : std::true_type {};

template <typename T>
struct is_future : std::false_type {};
template <typename T>
struct is_future<std::future<T>> : std::true_type {};

template <typename T, typename = void>
struct is_record : std::false_type {};
template <typename T>
struct is_record<T, std::void_t<decltype(RecordTraits<T>::Fields())>>
    : std::true_type {};

template <typename T, typename = void>
struct has_enum_names : std::false_type {};
template <typename T>
struct has_enum_names<T, std::void_t<decltype(EnumTraits<T>::Values())>>
    : std::true_type {};

// Signature of a function pointer, function type, lambda or functor.
template <typename Fn>
struct CallableTraits : CallableTraits<decltype(&remove_cvref_t<Fn>::operator())> {};

template <typename R, typename... A>
struct CallableTraits<R (*)(A...)> {
    using ReturnType = R;
    using ArgsTuple = std::tuple<A...>;
    static constexpr std::size_t kArity = sizeof...(A);
};

template <typename R, typename... A>
struct CallableTraits<R(A...)> : CallableTraits<R (*)(A...)> {};

template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...) const> : CallableTraits<R (*)(A...)> {};

template <typename R, typename C, typename... A>
struct CallableTraits<R (C::*)(A...)> : CallableTraits<R (*)(A...)> {};

template <typename E>
const char* EnumName(E value) {
    for (const auto& entry : EnumTraits<E>::Values()) {
        if (entry.first == value) return entry.second;
    }
    return nullptr;
}

inline std::string Dump(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace detail

// ---------------------------------------------------------------------------
// TypeOf<T>(): derive the TypeSpec of a declared C++ type.
// ---------------------------------------------------------------------------
template <typename T>
TypeSpec TypeOf() {
    using U = detail::remove_cvref_t<T>;

    if constexpr (detail::is_optional<U>::value) {
        return TypeOf<typename U::value_type>().AsNullable();
    } else if constexpr (std::is_same_v<U, bool>) {
        return TypeSpec::Boolean();
    } else if constexpr (std::is_integral_v<U>) {
        return TypeSpec::Integer();
    } else if constexpr (std::is_floating_point_v<U>) {
        return TypeSpec::Number();
    } else if constexpr (std::is_same_v<U, std::string>) {
        return TypeSpec::String();
    } else if constexpr (std::is_same_v<U, nlohmann::json>) {
        return TypeSpec::Json();
    } else if constexpr (std::is_enum_v<U>) {
        static_assert(detail::has_enum_names<U>::value,
                      "enum parameters need an EnumTraits<E> specialization");
        std::vector<std::string> names;
        for (const auto& entry : EnumTraits<U>::Values()) {
            names.emplace_back(entry.second);
        }
        return TypeSpec::Enum(std::move(names));
    } else if constexpr (detail::is_vector<U>::value) {
        return TypeSpec::Array(TypeOf<typename U::value_type>());
    } else if constexpr (detail::is_record<U>::value) {
        std::vector<FieldSpec> fields;
        std::apply(
            [&fields](const auto&... field) {
                (fields.push_back(FieldSpec{
                     field.name,
                     TypeOf<typename detail::remove_cvref_t<decltype(field)>::member_type>(),
                     field.description
                         ? std::optional<std::string>(field.description)
                         : std::nullopt}),
                 ...);
            },
            RecordTraits<U>::Fields());
        return TypeSpec::Record(std::move(fields));
    } else {
        static_assert(detail::always_false<U>::value,
                      "unsupported tool type: use bool, integral, floating, "
                      "std::string, nlohmann::json, enums with EnumTraits, "
                      "std::vector, std::optional or records with RecordTraits");
        return TypeSpec{};
    }
}

// ---------------------------------------------------------------------------
// FromJson<T>() / ToJson<T>(): typed conversion of already-validated JSON.
// Records use lowerCamelCase member names; absent optionals are omitted.
// ---------------------------------------------------------------------------
template <typename T>
T FromJson(const nlohmann::json& value) {
    using U = detail::remove_cvref_t<T>;

    if constexpr (detail::is_optional<U>::value) {
        if (value.is_null()) return std::nullopt;
        return FromJson<typename U::value_type>(value);
    } else if constexpr (std::is_same_v<U, bool>) {
        return value.get<bool>();
    } else if constexpr (std::is_integral_v<U>) {
        if (value.is_number_unsigned()) {
            const auto v = value.get<std::uint64_t>();
            if (v > static_cast<std::uint64_t>(std::numeric_limits<U>::max())) {
                throw std::out_of_range("value " + std::to_string(v) +
                                        " is out of range");
            }
            return static_cast<U>(v);
        }
        const auto v = value.get<std::int64_t>();
        if constexpr (std::is_unsigned_v<U>) {
            if (v < 0 ||
                static_cast<std::uint64_t>(v) >
                    static_cast<std::uint64_t>(std::numeric_limits<U>::max())) {
                throw std::out_of_range("value " + std::to_string(v) +
                                        " is out of range");
            }
        } else {
            if (v < static_cast<std::int64_t>(std::numeric_limits<U>::min()) ||
                v > static_cast<std::int64_t>(std::numeric_limits<U>::max())) {
                throw std::out_of_range("value " + std::to_string(v) +
                                        " is out of range");
            }
        }
        return static_cast<U>(v);
    } else if constexpr (std::is_floating_point_v<U>) {
        return value.get<U>();
    } else if constexpr (std::is_same_v<U, std::string>) {
        if (value.is_null()) return std::string();
        return value.get<std::string>();
    } else if constexpr (std::is_same_v<U, nlohmann::json>) {
        return value;
    } else if constexpr (std::is_enum_v<U>) {
        const auto& text = value.get_ref<const std::string&>();
        for (const auto& entry : EnumTraits<U>::Values()) {
            if (text == entry.second) return entry.first;
        }
        throw std::invalid_argument("'" + text + "' is not one of the allowed values");
    } else if constexpr (detail::is_vector<U>::value) {
        U out;
        if (value.is_null()) return out;
        out.reserve(value.size());
        for (const auto& item : value) {
            out.push_back(FromJson<typename U::value_type>(item));
        }
        return out;
    } else if constexpr (detail::is_record<U>::value) {
        U out{};
        if (value.is_null()) return out;
        std::apply(
            [&out, &value](const auto&... field) {
                auto assign = [&out, &value](const auto& f) {
                    using M = typename detail::remove_cvref_t<decltype(f)>::member_type;
                    auto it = value.find(ToCamelCase(f.name));
                    if (it != value.end()) {
                        out.*(f.member) = FromJson<M>(*it);
                    }
                };
                (assign(field), ...);
            },
            RecordTraits<U>::Fields());
        return out;
    } else {
        static_assert(detail::always_false<U>::value, "unsupported tool type");
        return U{};
    }
}

template <typename T>
nlohmann::json ToJson(const T& value) {
    using U = detail::remove_cvref_t<T>;

    if constexpr (detail::is_optional<U>::value) {
        if (!value.has_value()) return nullptr;
        return ToJson<typename U::value_type>(*value);
    } else if constexpr (std::is_same_v<U, bool> || std::is_arithmetic_v<U> ||
                         std::is_same_v<U, std::string>) {
        return value;
    } else if constexpr (std::is_same_v<U, nlohmann::json>) {
        return value;
    } else if constexpr (std::is_enum_v<U>) {
        if (const char* name = detail::EnumName(value)) return name;
        return static_cast<std::underlying_type_t<U>>(value);
    } else if constexpr (detail::is_vector<U>::value) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) {
            out.push_back(ToJson<typename U::value_type>(item));
        }
        return out;
    } else if constexpr (detail::is_record<U>::value) {
        nlohmann::json out = nlohmann::json::object();
        std::apply(
            [&out, &value](const auto&... field) {
                auto emit = [&out, &value](const auto& f) {
                    using M = typename detail::remove_cvref_t<decltype(f)>::member_type;
                    auto encoded = ToJson<M>(value.*(f.member));
                    if (!encoded.is_null()) {
                        out[ToCamelCase(f.name)] = std::move(encoded);
                    }
                };
                (emit(field), ...);
            },
            RecordTraits<U>::Fields());
        return out;
    } else {
        static_assert(detail::always_false<U>::value, "unsupported tool type");
        return nullptr;
    }
}

// ---------------------------------------------------------------------------
// Tool output text for a returned value:
//   null (nullopt / JSON null) -> "null"
//   std::string               -> unchanged
//   std::future<void>         -> "success" once it completes
//   std::future<T>            -> the inner value, same rules
//   anything else             -> compact JSON
// A void return is rendered as "success" by the invoker.
// ---------------------------------------------------------------------------
template <typename T>
std::string RenderValue(const T& value) {
    using U = detail::remove_cvref_t<T>;

    if constexpr (detail::is_optional<U>::value) {
        if (!value.has_value()) return "null";
        return RenderValue(*value);
    } else if constexpr (std::is_same_v<U, std::string>) {
        return value;
    } else if constexpr (std::is_same_v<U, nlohmann::json>) {
        if (value.is_null()) return "null";
        return detail::Dump(value);
    } else {
        return detail::Dump(ToJson<U>(value));
    }
}

template <typename T>
std::string RenderResult(T& value) {
    using U = detail::remove_cvref_t<T>;

    if constexpr (detail::is_future<U>::value) {
        // Blocks the request thread until the deferred result is ready.
        using Inner = decltype(value.get());
        if constexpr (std::is_void_v<Inner>) {
            value.get();
            return "success";
        } else {
            auto inner = value.get();
            return RenderValue(inner);
        }
    } else {
        return RenderValue(value);
    }
}

// ---------------------------------------------------------------------------
// ParameterAnnotation: per-parameter metadata supplied at registration.
// ---------------------------------------------------------------------------
struct ParameterAnnotation {
    std::string name;
    std::optional<std::string> description;
    std::optional<bool> required;
    std::optional<nlohmann::json> default_value;

    ParameterAnnotation& Describe(std::string text) {
        description = std::move(text);
        return *this;
    }

    ParameterAnnotation& Require(bool value) {
        required = value;
        return *this;
    }

    ParameterAnnotation& Default(nlohmann::json value) {
        default_value = std::move(value);
        return *this;
    }
};

inline ParameterAnnotation Param(std::string name) {
    ParameterAnnotation annotation;
    annotation.name = std::move(name);
    return annotation;
}

inline ParameterAnnotation Param(std::string name, std::string description) {
    ParameterAnnotation annotation;
    annotation.name = std::move(name);
    annotation.description = std::move(description);
    return annotation;
}

// ---------------------------------------------------------------------------
// AnnotatedTool: one entry of the startup registration table.
// `invoke` receives the values produced by BindArguments(), one per
// parameter, and returns the tool's output text.
// ---------------------------------------------------------------------------
struct AnnotatedTool {
    std::string name;
    std::string description;
    std::vector<ParameterSpec> parameters;
    std::function<std::string(const std::vector<nlohmann::json>& bound)> invoke;
};

using ToolCatalog = std::vector<AnnotatedTool>;

namespace detail {

template <typename T>
T DecodeArgument(const ParameterSpec& param, const nlohmann::json& value) {
    try {
        return FromJson<T>(value);
    } catch (const std::exception& e) {
        throw InvalidParams("Invalid parameter '" + param.name + "': " + e.what());
    }
}

template <typename Fn, typename... Args, std::size_t... I>
std::string InvokeBound(Fn& fn, const std::vector<ParameterSpec>& params,
                        const std::vector<nlohmann::json>& bound,
                        std::tuple<Args...>*, std::index_sequence<I...>) {
    (void)params;
    (void)bound;
    // Braced initialization decodes arguments left to right.
    std::tuple<remove_cvref_t<Args>...> values{
        DecodeArgument<remove_cvref_t<Args>>(params[I], bound[I])...};

    using R = typename CallableTraits<Fn>::ReturnType;
    if constexpr (std::is_void_v<R>) {
        std::apply(fn, std::move(values));
        return "success";
    } else {
        auto result = std::apply(fn, std::move(values));
        return RenderResult(result);
    }
}

template <typename... Args>
std::vector<ParameterSpec> MakeParameterSpecs(
    std::vector<ParameterAnnotation> annotations, std::tuple<Args...>*) {
    std::vector<TypeSpec> types{TypeOf<Args>()...};
    std::vector<ParameterSpec> specs;
    specs.reserve(types.size());
    for (std::size_t i = 0; i < types.size(); ++i) {
        auto& a = annotations[i];
        specs.push_back(ParameterSpec{std::move(a.name), std::move(types[i]),
                                      std::move(a.description), a.required,
                                      std::move(a.default_value)});
    }
    return specs;
}

} // namespace detail

// Build a registration-table entry from a typed callable. Parameter types
// come from the callable's signature; names, descriptions, required
// overrides and defaults from `annotations`, one per parameter in order.
// Throws std::invalid_argument when the counts differ or a default does not
// decode as its parameter's type.
template <typename Fn>
AnnotatedTool MakeAnnotatedTool(std::string name, std::string description,
                                std::vector<ParameterAnnotation> annotations,
                                Fn fn) {
    using Traits = detail::CallableTraits<Fn>;
    using ArgsTuple = typename Traits::ArgsTuple;

    if (annotations.size() != Traits::kArity) {
        throw std::invalid_argument(
            "tool '" + name + "' annotates " +
            std::to_string(annotations.size()) + " parameter(s) but takes " +
            std::to_string(Traits::kArity));
    }

    AnnotatedTool tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.parameters = detail::MakeParameterSpecs(
        std::move(annotations), static_cast<ArgsTuple*>(nullptr));
    for (auto& param : tool.parameters) {
        if (!param.default_value) continue;
        try {
            param.default_value = DecodeValue(param.type, *param.default_value);
        } catch (const DecodeError& e) {
            throw std::invalid_argument("tool '" + tool.name +
                                        "': bad default for parameter '" +
                                        param.name + "': " + e.what());
        }
    }

    tool.invoke = [fn = std::move(fn), params = tool.parameters](
                      const std::vector<nlohmann::json>& bound) mutable {
        if (bound.size() != Traits::kArity) {
            throw McpError("argument count mismatch",
                           rpc_error::kInternalError);
        }
        return detail::InvokeBound(fn, params, bound,
                                   static_cast<ArgsTuple*>(nullptr),
                                   std::make_index_sequence<Traits::kArity>{});
    };
    return tool;
}

} // namespace toolwire
