//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error hierarchy for the OAuth relay coordinator and client
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace oauthrelay {
namespace errors {

// Categorization of relay failures.
enum class ErrorCategory {
    Protocol,    // malformed wire record
    Connection,  // coordinator unreachable
    Timeout,     // no delivery within the wait window
    Relay,       // coordinator closed early or sent an unexpected message
    Bind         // coordinator could not bind its listening transport
};

//==========================================================================================================
// errorCategoryName
// Purpose: Stable lower-case name of an ErrorCategory for logs and CLI output.
// Args:
//   category: Category to name.
// Returns:
//   Static C-string; never null.
//==========================================================================================================
inline const char* errorCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Protocol: return "protocol";
        case ErrorCategory::Connection: return "connection";
        case ErrorCategory::Timeout: return "timeout";
        case ErrorCategory::Relay: return "relay";
        case ErrorCategory::Bind: return "bind";
    }
    return "unknown";
}

//==========================================================================================================
// RelayError
// Purpose: Base of all relay errors. Thrown directly when the coordinator behaved unexpectedly
//          (closed without result, replied with a non-DELIVER message).
//==========================================================================================================
class RelayError : public std::runtime_error {
public:
    explicit RelayError(const std::string& message, ErrorCategory category = ErrorCategory::Relay)
        : std::runtime_error(message), category_(category) {}

    ErrorCategory category() const noexcept { return category_; }

private:
    ErrorCategory category_;
};

// Malformed wire message; local decode failure.
class ProtocolError : public RelayError {
public:
    explicit ProtocolError(const std::string& message)
        : RelayError(message, ErrorCategory::Protocol) {}
};

// Transport-level failure to reach the coordinator (refused, missing socket, connect timeout).
class ConnectionError : public RelayError {
public:
    explicit ConnectionError(const std::string& message)
        : RelayError(message, ErrorCategory::Connection) {}
};

// No delivery arrived within the effective wait window.
class TimeoutError : public RelayError {
public:
    explicit TimeoutError(const std::string& message)
        : RelayError(message, ErrorCategory::Timeout) {}
};

// Coordinator could not bind its transport (address in use, permission denied, live peer on path).
class BindError : public RelayError {
public:
    explicit BindError(const std::string& message)
        : RelayError(message, ErrorCategory::Bind) {}
};

} // namespace errors
} // namespace oauthrelay
