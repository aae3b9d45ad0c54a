#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace voxlink {

/**
 * @brief Error categories surfaced by the client
 */
enum class ErrorType {
    None,
    ConfigError,         ///< Invalid or incomplete configuration
    AlreadyConnecting,   ///< start() while a connection attempt is in flight
    TransportError,      ///< Socket failed to open, closed unexpectedly or refused a send
    ProtocolError,       ///< Inbound frame could not be parsed
    NotReady,            ///< Operation requires the Ready state
    UpstreamError,       ///< Error frame reported by the speech service
    IOError,
    ParseError
};

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::ConfigError: return "config_error";
        case ErrorType::AlreadyConnecting: return "already_connecting";
        case ErrorType::TransportError: return "transport_error";
        case ErrorType::ProtocolError: return "protocol_error";
        case ErrorType::NotReady: return "not_ready";
        case ErrorType::UpstreamError: return "upstream_error";
        case ErrorType::IOError: return "io_error";
        case ErrorType::ParseError: return "parse_error";
    }
    return "unknown";
}

/**
 * @brief Error information structure
 *
 * code carries the upstream error code for UpstreamError; fatal marks errors
 * that drove the connection into Errored.
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;
    std::string code;
    bool fatal = false;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}
    Error(ErrorType t, const std::string& msg, const std::string& c, bool is_fatal)
        : type(t), message(msg), code(c), fatal(is_fatal) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
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

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::ConfigError, message);
}

inline Error make_already_connecting_error(const std::string& message = "Connection attempt already in progress") {
    return Error(ErrorType::AlreadyConnecting, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::TransportError, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolError, message);
}

inline Error make_not_ready_error(const std::string& message = "Connection is not ready") {
    return Error(ErrorType::NotReady, message);
}

inline Error make_upstream_error(const std::string& message, const std::string& code, bool fatal) {
    return Error(ErrorType::UpstreamError, message, code, fatal);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

} // namespace voxlink
