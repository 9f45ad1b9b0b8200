#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace toolwire {

// Startup failures (CLI, config file, resources) and the exit code each maps
// to. Request handling reports failures with McpError instead.
enum class ErrorCategory {
    Config,    // 2
    Usage,     // 2
    Io,        // 3
    NotFound,  // 4
    Internal,  // 99
};

inline int ExitCodeFor(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Config:
        case ErrorCategory::Usage:
            return 2;
        case ErrorCategory::Io:
            return 3;
        case ErrorCategory::NotFound:
            return 4;
        case ErrorCategory::Internal:
            break;
    }
    return 99;
}

inline const char* CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Config:   return "config";
        case ErrorCategory::Usage:    return "usage";
        case ErrorCategory::Io:       return "io";
        case ErrorCategory::NotFound: return "not_found";
        case ErrorCategory::Internal: break;
    }
    return "internal";
}

struct Error {
    std::string operation;                 // e.g. "ConfigLoader"
    std::string message;
    std::optional<std::string> path;       // file the error refers to
    ErrorCategory category = ErrorCategory::Internal;

    [[nodiscard]] int ExitCode() const { return ExitCodeFor(category); }
    [[nodiscard]] std::string CategoryName() const {
        return toolwire::CategoryName(category);
    }

    // "operation [path]: message"
    [[nodiscard]] std::string ToString() const {
        std::string out = operation;
        if (path && !path->empty()) {
            out += " [" + *path + "]";
        }
        return out + ": " + message;
    }

    bool operator==(const Error& other) const {
        return std::tie(operation, message, path, category) ==
               std::tie(other.operation, other.message, other.path, other.category);
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& e) {
    return os << e.ToString();
}

// ---------------------------------------------------------------------------
// Result<T, E>: either a value or an error. Result<void, E> carries no value.
// Reading the wrong side throws std::logic_error.
// ---------------------------------------------------------------------------
template <typename T, typename E = Error>
class Result {
    using Stored = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

public:
    template <typename... Args>
    static Result Ok(Args&&... args) {
        return Result(std::in_place_index<0>, std::forward<Args>(args)...);
    }

    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    template <typename U = T>
    [[nodiscard]] std::enable_if_t<!std::is_void_v<U>, const U&> Value() const& {
        Expect(0, "Value() on an error result");
        return std::get<0>(state_);
    }

    template <typename U = T>
    [[nodiscard]] std::enable_if_t<!std::is_void_v<U>, U> Value() && {
        Expect(0, "Value() on an error result");
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] const E& Error() const& {
        Expect(1, "Error() on a successful result");
        return std::get<1>(state_);
    }

    [[nodiscard]] E Error() && {
        Expect(1, "Error() on a successful result");
        return std::get<1>(std::move(state_));
    }

private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args&&... args)
        : state_(tag, std::forward<Args>(args)...) {}

    void Expect(std::size_t index, const char* what) const {
        if (state_.index() != index) {
            throw std::logic_error(what);
        }
    }

    std::variant<Stored, E> state_;
};

} // namespace toolwire
