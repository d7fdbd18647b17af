//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Named constructors for the RFC 6749 failure scenarios
//==========================================================================================================

#pragma once

#include <string>

#include "oauth/errors/ProtocolError.h"

namespace oauth {
namespace errors {

// invalid_grant (400), hint "Check the `grant_type` parameter".
ProtocolError invalidGrant();

// unsupported_grant_type (400), hint "Check the `grant_type` parameter".
ProtocolError unsupportedGrantType();

// invalid_request (400).
//
// Args:
//   parameter: Name of the missing or malformed request parameter.
//   details: details.hint, when set, replaces the synthesized "Check the `<parameter>` parameter".
//            details.redirectUri is ignored.
ProtocolError invalidRequest(const std::string& parameter, const ErrorDetails& details = {});

// invalid_client (401), no hint. Rendering adds WWW-Authenticate when the request carried credentials.
ProtocolError invalidClient();

// invalid_scope (400).
//
// Args:
//   scope: The rejected scope; the hint becomes "Check the `<scope>` scope".
//   details: details.redirectUri is passed through for redirect delivery; details.hint is ignored.
ProtocolError invalidScope(const std::string& scope, const ErrorDetails& details = {});

// invalid_credentials (401), no hint.
ProtocolError invalidCredentials();

// server_error (500). The hint is appended to the message; the hint field stays empty.
ProtocolError serverError(const std::string& hint);

// invalid_request (400) with code InvalidRefreshToken; details.hint passed through.
ProtocolError invalidRefreshToken(const ErrorDetails& details = {});

// access_denied (401); details.hint and details.redirectUri passed through.
ProtocolError accessDenied(const ErrorDetails& details = {});

} // namespace errors
} // namespace oauth
