#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace toolwire {

// JSON-RPC 2.0 error codes the server emits, plus the MCP resource-not-found
// code. Malformed lines get no reply, so there is no parse-error code.
namespace rpc_error {
constexpr int kMethodNotFound   = -32601;
constexpr int kInvalidParams    = -32602;
constexpr int kInternalError    = -32603;
constexpr int kResourceNotFound = -32002;
constexpr int kToolFailure      = -32000;  // implementation-defined server error
} // namespace rpc_error

// ---------------------------------------------------------------------------
// McpError: a protocol-level failure. Thrown anywhere below the dispatcher
// (routing, binding, tool bodies) and mapped 1:1 onto the response's
// `error` object. Any other exception becomes an internal error.
// ---------------------------------------------------------------------------
class McpError : public std::runtime_error {
public:
    explicit McpError(const std::string& message,
                      int code = rpc_error::kInternalError,
                      std::optional<nlohmann::json> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    [[nodiscard]] int Code() const noexcept { return code_; }
    [[nodiscard]] const std::optional<nlohmann::json>& Data() const noexcept {
        return data_;
    }

    // {code, message, data?} as it appears on the wire.
    [[nodiscard]] nlohmann::json ToJson() const {
        nlohmann::json error = {{"code", code_}, {"message", what()}};
        if (data_.has_value() && !data_->is_null()) {
            error["data"] = *data_;
        }
        return error;
    }

private:
    int code_;
    std::optional<nlohmann::json> data_;
};

inline McpError InvalidParams(const std::string& message) {
    return McpError(message, rpc_error::kInvalidParams);
}

inline McpError MethodNotFound(const std::string& message) {
    return McpError(message, rpc_error::kMethodNotFound);
}

} // namespace toolwire
