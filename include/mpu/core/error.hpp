#pragma once

#include <string>

namespace mpu {

/**
 * @brief Failure categories shared by every layer
 *
 * The HTTP surface maps these to status codes: Config and Validation are
 * client errors (400), NotFound is 404, everything else is reported as 500.
 */
enum class ErrorCode {
    Config,        ///< Plan violates backend limits; never reaches the backend
    Validation,    ///< Malformed request, missing fields, part out of range
    Backend,       ///< Object store rejected the operation
    Network,       ///< Transport failure while talking to the relay
    NotFound,      ///< Object or upload does not exist
    InvalidState,  ///< Operation not allowed in the current session state
    Io             ///< Local file read/write failure
};

struct Error {
    ErrorCode code = ErrorCode::Backend;
    std::string message;

    static Error config(std::string msg) { return Error{ErrorCode::Config, std::move(msg)}; }
    static Error validation(std::string msg) { return Error{ErrorCode::Validation, std::move(msg)}; }
    static Error backend(std::string msg) { return Error{ErrorCode::Backend, std::move(msg)}; }
    static Error network(std::string msg) { return Error{ErrorCode::Network, std::move(msg)}; }
    static Error not_found(std::string msg) { return Error{ErrorCode::NotFound, std::move(msg)}; }
    static Error invalid_state(std::string msg) { return Error{ErrorCode::InvalidState, std::move(msg)}; }
    static Error io(std::string msg) { return Error{ErrorCode::Io, std::move(msg)}; }
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Config: return "ConfigError";
        case ErrorCode::Validation: return "ValidationError";
        case ErrorCode::Backend: return "BackendError";
        case ErrorCode::Network: return "NetworkError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Io: return "IoError";
    }
    return "Unknown";
}

} // namespace mpu
