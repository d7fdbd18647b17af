//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Example printing the HTTP responses an authorization server sends for typical failures
//==========================================================================================================

#include <iostream>
#include <string>
#include <utility>

#include <boost/beast/http/write.hpp>

#include "logging/Logger.h"
#include "oauth/ErrorResponder.hpp"
#include "oauth/errors/Errors.h"
#include "oauth/errors/OAuthServerException.h"
#include "oauth/version.h"

using namespace oauth;

namespace {

// Stand-in for grant handling: rejects any scope other than "profile".
void checkScope(const std::string& scope, const std::string& redirectUri) {
    if (scope != "profile") {
        throw errors::OAuthServerException(errors::invalidScope(scope, {.redirectUri = redirectUri}));
    }
}

void print(const std::string& title, const HttpResponse& res) {
    std::cout << "=== " << title << " ===\n" << res << "\n\n";
}

} // namespace

int main() {
    Logger::configureFromEnv();
    LOG_INFO("OAuth error responder example v{}", getVersionString());

    // Token endpoint: missing parameter
    print("invalid_request", generateHttpResponse(errors::invalidRequest("grant_type")));

    // Token endpoint: client authentication failed with a Bearer attempt
    HttpRequest raw{http::verb::post, "/token", 11};
    raw.set(http::field::authorization, "Bearer abc123");
    ServerRequest request = ServerRequest::fromMessage(std::move(raw));
    RenderOptions withRequest;
    withRequest.request = &request;
    print("invalid_client", generateHttpResponse(errors::invalidClient(), withRequest));

    // Authorization endpoint: error delivered by redirect, once in the query and once in the fragment
    try {
        checkScope("email", "https://client.example/cb?state=xyz");
    } catch (const errors::OAuthServerException& e) {
        print("invalid_scope (query)", generateHttpResponse(e.error()));
        RenderOptions fragment;
        fragment.useFragment = true;
        print("invalid_scope (fragment)", generateHttpResponse(e.error(), fragment));
    }

    print("server_error", generateHttpResponse(errors::serverError("database unreachable")));
    return 0;
}
