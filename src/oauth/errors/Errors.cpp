//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/errors/Errors.cpp
// Purpose: Canonical messages, hints and statuses for each failure scenario
//==========================================================================================================

#include <string>

#include "oauth/errors/Errors.h"

namespace oauth {
namespace errors {

namespace {
    const char* kGrantTypeHint = "Check the `grant_type` parameter";
}

ProtocolError invalidGrant() {
    ErrorDetails d;
    d.hint = kGrantTypeHint;
    return ProtocolError(ErrorCode::InvalidGrant, ErrorType::InvalidGrant, 400,
        "The provided authorization grant is invalid, expired, revoked, does not match "
        "the redirection URI used in the authorization request, or was issued to another client.",
        d);
}

ProtocolError unsupportedGrantType() {
    ErrorDetails d;
    d.hint = kGrantTypeHint;
    return ProtocolError(ErrorCode::UnsupportedGrantType, ErrorType::UnsupportedGrantType, 400,
        "The authorization grant type is not supported by the authorization server.", d);
}

ProtocolError invalidRequest(const std::string& parameter, const ErrorDetails& details) {
    ErrorDetails d;
    d.hint = details.hint.has_value() ? details.hint.value()
                                      : std::string("Check the `") + parameter + "` parameter";
    return ProtocolError(ErrorCode::InvalidRequest, ErrorType::InvalidRequest, 400,
        "The request is missing a required parameter, includes an invalid parameter value, "
        "includes a parameter more than once, or is otherwise malformed.",
        d);
}

ProtocolError invalidClient() {
    return ProtocolError(ErrorCode::InvalidClient, ErrorType::InvalidClient, 401,
        "Client authentication failed");
}

ProtocolError invalidScope(const std::string& scope, const ErrorDetails& details) {
    ErrorDetails d;
    d.hint = std::string("Check the `") + scope + "` scope";
    d.redirectUri = details.redirectUri;
    return ProtocolError(ErrorCode::InvalidScope, ErrorType::InvalidScope, 400,
        "The requested scope is invalid, unknown, or malformed", d);
}

ProtocolError invalidCredentials() {
    return ProtocolError(ErrorCode::InvalidCredentials, ErrorType::InvalidCredentials, 401,
        "The user credentials were incorrect.");
}

ProtocolError serverError(const std::string& hint) {
    return ProtocolError(ErrorCode::ServerError, ErrorType::ServerError, 500,
        "The authorization server encountered an unexpected condition which prevented it from fulfilling"
        " the request: " + hint);
}

ProtocolError invalidRefreshToken(const ErrorDetails& details) {
    ErrorDetails d;
    d.hint = details.hint;
    return ProtocolError(ErrorCode::InvalidRefreshToken, ErrorType::InvalidRequest, 400,
        "The refresh token is invalid.", d);
}

ProtocolError accessDenied(const ErrorDetails& details) {
    return ProtocolError(ErrorCode::AccessDenied, ErrorType::AccessDenied, 401,
        "The resource owner or authorization server denied the request.", details);
}

} // namespace errors
} // namespace oauth
