#ifndef DEVMUX_CORE_ERROR_H
#define DEVMUX_CORE_ERROR_H

#include <string>
#include <ostream>

namespace devmux {
namespace core {

/**
 * @brief Classes of failure reported by the device layer.
 */
enum class ErrorCode {
    ArgumentError,     ///< Invalid or missing session/channel reference, unknown session kind
    NotSupported,      ///< No channel capability can serve the request
    ConnectionFailed,  ///< Transport-level failure during connect or pair
    PairingRequired,   ///< Connect stopped because the device requires pairing
    DecodeError,       ///< Malformed or unrecognized persisted record
    IOError            ///< Store file could not be read or written
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::ArgumentError: return "argument error";
        case ErrorCode::NotSupported: return "not supported";
        case ErrorCode::ConnectionFailed: return "connection failed";
        case ErrorCode::PairingRequired: return "pairing required";
        case ErrorCode::DecodeError: return "decode error";
        case ErrorCode::IOError: return "io error";
        default: return "unknown";
    }
}

/**
 * @brief An error code with a human readable detail message.
 */
struct Error {
    ErrorCode code{ErrorCode::ArgumentError};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool isPairingRequired() const { return code == ErrorCode::PairingRequired; }

    std::string toString() const {
        return std::string(errorCodeToString(code)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.toString();
}

} // namespace core
} // namespace devmux

#endif // DEVMUX_CORE_ERROR_H
