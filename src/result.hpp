// =============================================================================
// DroidPilot - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every fallible bridge, transport and RPC operation returns one of these.
//
// Usage:
//   Result<std::string> shell(const std::string& cmd) {
//       if (exit_code != 0) return Error(ErrorKind::Bridge, "adb failed", err);
//       return Ok(output);
//   }
//
//   auto result = bridge.shell("pm list packages");
//   if (result.is_err()) {
//       DPLOG_ERROR("adb", "%s", result.error().describe().c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <type_traits>

namespace droidpilot {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Bridge,        // adb exited non-zero or could not be spawned
    Transport,     // connection failure or non-2xx HTTP status
    Protocol,      // test-server answered, but reported failure
    Precondition,  // required application / test-server missing
    Timeout,       // retry budget exhausted
    Format,        // malformed map-route argument
    Install,       // install / uninstall / clear did not report success
    Parse,         // unparsable bridge output or malformed JSON
    Io,            // local file I/O
    Other
};

inline const char* errorKindStr(ErrorKind k) {
    switch (k) {
        case ErrorKind::Bridge:       return "BridgeError";
        case ErrorKind::Transport:    return "TransportError";
        case ErrorKind::Protocol:     return "ProtocolError";
        case ErrorKind::Precondition: return "PreconditionError";
        case ErrorKind::Timeout:      return "TimeoutError";
        case ErrorKind::Format:       return "FormatError";
        case ErrorKind::Install:      return "InstallError";
        case ErrorKind::Parse:        return "ParseError";
        case ErrorKind::Io:           return "IoError";
        case ErrorKind::Other:        return "Error";
    }
    return "Error";
}

// Error with kind, human readable message and diagnostic detail
// (raw adb output, captured stderr, decoded reason, probe kind, ...)
struct Error {
    ErrorKind kind = ErrorKind::Other;
    std::string message;
    std::string detail;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
    Error(ErrorKind k, std::string msg, std::string det = {}, int c = 0)
        : kind(k), message(std::move(msg)), detail(std::move(det)), code(c) {}

    bool is(ErrorKind k) const { return kind == k; }

    // "TimeoutError: Could not contact test-server (last: ...)"
    std::string describe() const {
        std::string s = std::string(errorKindStr(kind)) + ": " + message;
        if (!detail.empty()) s += "\n" + detail;
        return s;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
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

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    // Success constructor
    Result() : data_(std::monostate{}) {}

    // Error constructor
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

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

// Create success result
template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

// Create void success
inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, std::string detail = {}) {
    return Result<T, Error>(Error(kind, std::move(message), std::move(detail)));
}

// =============================================================================
// Macros for Early Return
// =============================================================================

// TRY macro: unwrap result or return error
// Usage: auto value = DP_TRY(some_function());
#define DP_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace droidpilot
