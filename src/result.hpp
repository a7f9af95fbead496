// =============================================================================
// emu - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every failable operation in the core (command execution, device managers,
// cache store, validators) reports through it instead of throwing.
//
// Usage:
//   Result<std::string> listAvds() {
//       if (!tool_found) return Err<std::string>("avdmanager not found",
//                                                ErrorCode::ToolNotFound);
//       return Ok(output);
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace emu {

// =============================================================================
// Error Classification
// =============================================================================

enum class ErrorCode : int {
    None = 0,
    CommandFailed,     // non-zero exit
    SpawnFailed,       // process could not be started
    Timeout,
    ToolNotFound,      // SDK / executable missing
    DeviceNotFound,
    ParseError,
    ValidationFailed,
    CreateFailed,
    Io,
    Unsupported,       // platform tool unavailable on this host
};

inline const char* errorCodeStr(ErrorCode c) {
    switch (c) {
        case ErrorCode::None:             return "None";
        case ErrorCode::CommandFailed:    return "CommandFailed";
        case ErrorCode::SpawnFailed:      return "SpawnFailed";
        case ErrorCode::Timeout:          return "Timeout";
        case ErrorCode::ToolNotFound:     return "ToolNotFound";
        case ErrorCode::DeviceNotFound:   return "DeviceNotFound";
        case ErrorCode::ParseError:       return "ParseError";
        case ErrorCode::ValidationFailed: return "ValidationFailed";
        case ErrorCode::CreateFailed:     return "CreateFailed";
        case ErrorCode::Io:               return "Io";
        case ErrorCode::Unsupported:      return "Unsupported";
    }
    return "Unknown";
}

// =============================================================================
// Error Types
// =============================================================================

// Generic error with message
struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
    Error(std::string msg, ErrorCode c) : message(std::move(msg)), code(static_cast<int>(c)) {}

    ErrorCode kind() const { return static_cast<ErrorCode>(code); }
    bool is(ErrorCode c) const { return code == static_cast<int>(c); }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// External process error (exit code kept for callers that branch on it)
struct CommandError : Error {
    int exit_code = -1;

    CommandError() = default;
    CommandError(std::string msg, int exit, ErrorCode c = ErrorCode::CommandFailed)
        : Error(std::move(msg), c), exit_code(exit) {}
};

// IO error (file access)
struct IoError : Error {
    enum class Kind {
        NotFound,
        PermissionDenied,
        Other
    };
    Kind kind = Kind::Other;

    IoError() = default;
    explicit IoError(std::string msg, Kind k = Kind::Other)
        : Error(std::move(msg), ErrorCode::Io), kind(k) {}
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    // Check status
    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    // Safe access with default
    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    // Map success value
    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

    // Map error
    template<typename F>
    auto map_err(F&& f) const& -> Result<T, decltype(f(std::declval<E>()))> {
        using U = decltype(f(std::declval<E>()));
        if (is_err()) return Result<T, U>(f(std::get<1>(data_)));
        return Result<T, U>(std::get<0>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T, typename E = Error>
Result<T, E> Err(E error) {
    return Result<T, E>(std::move(error));
}

template<typename T>
Result<T, Error> Err(std::string message, ErrorCode code) {
    return Result<T, Error>(Error(std::move(message), code));
}

template<typename T>
Result<T, Error> Err(const char* message, ErrorCode code = ErrorCode::None) {
    return Result<T, Error>(Error(std::string(message), code));
}

template<typename T>
Result<T, Error> Err(std::string message) {
    return Result<T, Error>(Error(std::move(message)));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// Unwrap result or return its error from the enclosing function
// Usage: auto out = EMU_TRY(executor.run(tool, args));
#define EMU_TRY(expr) \
    ({ \
        auto _emu_result = (expr); \
        if (_emu_result.is_err()) return _emu_result.error(); \
        std::move(_emu_result).value(); \
    })

// Propagate the error of a Result<void>
#define EMU_TRY_VOID(expr) \
    do { \
        auto _emu_result = (expr); \
        if (_emu_result.is_err()) return _emu_result.error(); \
    } while (0)

} // namespace emu
