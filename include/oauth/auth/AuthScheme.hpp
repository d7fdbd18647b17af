//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthScheme.hpp
// Purpose: Detect the client's authentication scheme and build the matching WWW-Authenticate challenge
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oauth/http/ServerRequest.hpp"

namespace oauth::auth {

enum class AuthScheme {
    Basic,
    Bearer,
    MAC
};

// Realm advertised in every challenge built by this library.
inline constexpr const char* kChallengeRealm = "OAuth";

// "Basic", "Bearer" or "MAC"
const char* authSchemeToString(AuthScheme scheme);

//==========================================================================================================
// detectAuthScheme
// Purpose: Determine which scheme the client attempted to authenticate with.
// Order:
//   1. serverParams.authUser present -> Basic.
//   2. First Authorization header value starting with "Bearer", "MAC" or "Basic" (case-sensitive).
// Returns:
//   The scheme, or std::nullopt when the request carries no recognizable credentials.
//==========================================================================================================
std::optional<AuthScheme> detectAuthScheme(const ServerRequest& request);

//==========================================================================================================
// buildChallenge
// Purpose: WWW-Authenticate value for the scheme, e.g. `Bearer realm="OAuth"`.
//==========================================================================================================
std::string buildChallenge(AuthScheme scheme, const std::string& realm = kChallengeRealm);

} // namespace oauth::auth
