/**
 * @file errors.hpp
 * @brief Exception types raised by the device control core.
 *
 * @copyright Copyright (c) 2024 Lumen Contributors
 * @license MIT License
 */

#pragma once

#include "lumen/core/export.hpp"

#include <stdexcept>
#include <string>

namespace lumen {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of a LumenError.
 */
enum class ErrorKind {
    VALIDATION,    ///< Out-of-range input, rejected before any I/O
    FORMAT,        ///< Malformed textual input (e.g. hex colour), rejected before any I/O
    PROTOCOL,      ///< Device answered with success=false
    TIMEOUT,       ///< No matching response before the deadline
    TRANSPORT,     ///< Socket-level failure
    CLOSED,        ///< Proxy closed before or while the command was in flight
    BACKPRESSURE   ///< Too many commands already in flight for the device
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION: return "validation";
        case ErrorKind::FORMAT: return "format";
        case ErrorKind::PROTOCOL: return "protocol";
        case ErrorKind::TIMEOUT: return "timeout";
        case ErrorKind::TRANSPORT: return "transport";
        case ErrorKind::CLOSED: return "closed";
        case ErrorKind::BACKPRESSURE: return "backpressure";
        default: return "unknown";
    }
}

/**
 * @class LumenError
 * @brief Base class of every error surfaced by the core.
 */
class LUMEN_CORE_API LumenError : public std::runtime_error {
public:
    LumenError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class LUMEN_CORE_API ValidationError : public LumenError {
public:
    explicit ValidationError(const std::string& message)
        : LumenError(ErrorKind::VALIDATION, message) {}

protected:
    ValidationError(ErrorKind kind, const std::string& message)
        : LumenError(kind, message) {}
};

class LUMEN_CORE_API FormatError : public ValidationError {
public:
    explicit FormatError(const std::string& message)
        : ValidationError(ErrorKind::FORMAT, message) {}
};

/**
 * @brief The device rejected a command. what() carries the device's message.
 */
class LUMEN_CORE_API ProtocolError : public LumenError {
public:
    explicit ProtocolError(const std::string& message)
        : LumenError(ErrorKind::PROTOCOL, message) {}
};

class LUMEN_CORE_API TimeoutError : public LumenError {
public:
    explicit TimeoutError(const std::string& message)
        : LumenError(ErrorKind::TIMEOUT, message) {}
};

class LUMEN_CORE_API TransportError : public LumenError {
public:
    explicit TransportError(const std::string& message)
        : LumenError(ErrorKind::TRANSPORT, message) {}
};

class LUMEN_CORE_API ClosedError : public LumenError {
public:
    explicit ClosedError(const std::string& message = "Connection closed")
        : LumenError(ErrorKind::CLOSED, message) {}
};

class LUMEN_CORE_API BackpressureError : public LumenError {
public:
    explicit BackpressureError(const std::string& message)
        : LumenError(ErrorKind::BACKPRESSURE, message) {}
};

}  // namespace core
}  // namespace lumen
