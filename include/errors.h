#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace voice_relay {

/**
 * @brief Error categories for relay failure modes
 */
enum class ErrorType {
    None,
    AdmissionRefused,   ///< Connection registry is at capacity
    NetworkError,       ///< DNS, TCP, TLS or WebSocket failure
    AuthError,          ///< Credential acquisition failed
    ParseError,         ///< Malformed JSON or frame
    InvalidState,       ///< Operation not allowed in the current session state
    Closed,             ///< Transport closed by peer or by cleanup
    Unknown
};

inline const char* error_type_name(ErrorType type);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    std::string describe() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

using VoidResult = Result<void>;

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_auth_error(const std::string& message) {
    return Error(ErrorType::AuthError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_closed_error(const std::string& message = "Transport closed") {
    return Error(ErrorType::Closed, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:             return "none";
        case ErrorType::AdmissionRefused: return "admission_refused";
        case ErrorType::NetworkError:     return "network_error";
        case ErrorType::AuthError:        return "auth_error";
        case ErrorType::ParseError:       return "parse_error";
        case ErrorType::InvalidState:     return "invalid_state";
        case ErrorType::Closed:           return "closed";
        default:                          return "unknown";
    }
}

} // namespace voice_relay
