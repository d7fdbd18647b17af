//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolError.h
// Purpose: Immutable value describing one classified OAuth 2.0 protocol failure
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace oauth {
namespace errors {

// Stable identity of each failure scenario. Values are part of the public contract: new scenarios take
// a new number, existing ones are never renumbered.
enum class ErrorCode : int {
    InvalidGrant = 1,
    UnsupportedGrantType = 2,
    InvalidRequest = 3,
    InvalidClient = 4,
    InvalidScope = 5,
    InvalidCredentials = 6,
    ServerError = 7,
    InvalidRefreshToken = 8,
    AccessDenied = 9
};

// Wire-visible RFC 6749 error identifiers.
enum class ErrorType {
    InvalidGrant,
    UnsupportedGrantType,
    InvalidRequest,
    InvalidClient,
    InvalidScope,
    InvalidCredentials,
    ServerError,
    AccessDenied
};

// "invalid_grant", "unsupported_grant_type", ...
const char* errorTypeToString(ErrorType type);

//==========================================================================================================
// ErrorDetails
// Purpose: Optional scenario-specific inputs, passed by name to the factories.
// Fields:
//   hint: Guidance on which parameter or condition caused the failure.
//   redirectUri: Client URI to send the user agent back to with the error merged in.
//==========================================================================================================
struct ErrorDetails {
    std::optional<std::string> hint;
    std::optional<std::string> redirectUri;
};

//==========================================================================================================
// ProtocolError
// Purpose: One failure scenario with its wire-visible type, message, hint and HTTP status.
// Notes:
//   - Normally obtained from the factories in oauth/errors/Errors.h.
//   - The constructor throws std::invalid_argument when the status is not 400/401/500 or the message
//     is empty.
//==========================================================================================================
class ProtocolError {
public:
    ProtocolError(ErrorCode code,
                  ErrorType type,
                  int httpStatusCode,
                  std::string message,
                  ErrorDetails details = {});

    ErrorCode code() const { return code_; }
    ErrorType type() const { return type_; }
    std::string errorType() const { return errorTypeToString(type_); }
    int httpStatusCode() const { return httpStatusCode_; }
    const std::string& message() const { return message_; }
    const std::optional<std::string>& hint() const { return hint_; }
    const std::optional<std::string>& redirectUri() const { return redirectUri_; }

    bool operator==(const ProtocolError&) const = default;

private:
    ErrorCode code_;
    ErrorType type_;
    int httpStatusCode_;
    std::string message_;
    std::optional<std::string> hint_;
    std::optional<std::string> redirectUri_;
};

} // namespace errors
} // namespace oauth
