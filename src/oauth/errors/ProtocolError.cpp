//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/errors/ProtocolError.cpp
// Purpose: ProtocolError construction and error type names
//==========================================================================================================

#include <stdexcept>
#include <string>
#include <utility>

#include "oauth/errors/ProtocolError.h"

namespace oauth {
namespace errors {

const char* errorTypeToString(ErrorType type) {
    switch (type) {
        case ErrorType::InvalidGrant: return "invalid_grant";
        case ErrorType::UnsupportedGrantType: return "unsupported_grant_type";
        case ErrorType::InvalidRequest: return "invalid_request";
        case ErrorType::InvalidClient: return "invalid_client";
        case ErrorType::InvalidScope: return "invalid_scope";
        case ErrorType::InvalidCredentials: return "invalid_credentials";
        case ErrorType::ServerError: return "server_error";
        case ErrorType::AccessDenied: return "access_denied";
    }
    return "server_error";
}

ProtocolError::ProtocolError(ErrorCode code,
                             ErrorType type,
                             int httpStatusCode,
                             std::string message,
                             ErrorDetails details)
    : code_(code),
      type_(type),
      httpStatusCode_(httpStatusCode),
      message_(std::move(message)),
      hint_(std::move(details.hint)),
      redirectUri_(std::move(details.redirectUri)) {
    if (httpStatusCode_ != 400 && httpStatusCode_ != 401 && httpStatusCode_ != 500) {
        throw std::invalid_argument("ProtocolError: unsupported HTTP status " + std::to_string(httpStatusCode_));
    }
    if (message_.empty()) {
        throw std::invalid_argument("ProtocolError: message must not be empty");
    }
}

} // namespace errors
} // namespace oauth
