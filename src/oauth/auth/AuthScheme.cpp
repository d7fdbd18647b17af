//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/auth/AuthScheme.cpp
// Purpose: Authentication scheme detection for WWW-Authenticate challenges (RFC 6749 section 5.2)
//==========================================================================================================

#include <string>

#include "oauth/auth/AuthScheme.hpp"

namespace oauth::auth {

namespace {
    static bool startsWith(const std::string& s, const char* pfx) {
        return s.rfind(pfx, 0) == 0;
    }
}

const char* authSchemeToString(AuthScheme scheme) {
    switch (scheme) {
        case AuthScheme::Basic: return "Basic";
        case AuthScheme::Bearer: return "Bearer";
        case AuthScheme::MAC: return "MAC";
    }
    return "Basic";
}

std::optional<AuthScheme> detectAuthScheme(const ServerRequest& request) {
    if (request.serverParams.authUser.has_value()) {
        return AuthScheme::Basic;
    }

    auto header = request.authorizationHeader();
    if (!header.has_value()) {
        return std::nullopt;
    }
    if (startsWith(header.value(), "Bearer")) {
        return AuthScheme::Bearer;
    }
    if (startsWith(header.value(), "MAC")) {
        return AuthScheme::MAC;
    }
    if (startsWith(header.value(), "Basic")) {
        return AuthScheme::Basic;
    }
    return std::nullopt;
}

std::string buildChallenge(AuthScheme scheme, const std::string& realm) {
    return std::string(authSchemeToString(scheme)) + " realm=\"" + realm + "\"";
}

} // namespace oauth::auth
