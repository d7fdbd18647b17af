//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the ProtocolError factories and value semantics
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "oauth/errors/Errors.h"
#include "oauth/errors/OAuthServerException.h"

using namespace oauth::errors;

TEST(Errors, InvalidGrant) {
    auto e = invalidGrant();
    EXPECT_EQ(e.code(), ErrorCode::InvalidGrant);
    EXPECT_EQ(static_cast<int>(e.code()), 1);
    EXPECT_EQ(e.errorType(), std::string("invalid_grant"));
    EXPECT_EQ(e.httpStatusCode(), 400);
    ASSERT_TRUE(e.hint().has_value());
    EXPECT_EQ(e.hint().value(), std::string("Check the `grant_type` parameter"));
    EXPECT_FALSE(e.redirectUri().has_value());
    EXPECT_EQ(e.message(), std::string(
        "The provided authorization grant is invalid, expired, revoked, does not match the redirection URI "
        "used in the authorization request, or was issued to another client."));
}

TEST(Errors, UnsupportedGrantType) {
    auto e = unsupportedGrantType();
    EXPECT_EQ(static_cast<int>(e.code()), 2);
    EXPECT_EQ(e.errorType(), std::string("unsupported_grant_type"));
    EXPECT_EQ(e.httpStatusCode(), 400);
    EXPECT_EQ(e.hint().value(), std::string("Check the `grant_type` parameter"));
}

TEST(Errors, InvalidRequest_SynthesizesHintFromParameter) {
    auto e = invalidRequest("grant_type");
    EXPECT_EQ(static_cast<int>(e.code()), 3);
    EXPECT_EQ(e.errorType(), std::string("invalid_request"));
    EXPECT_EQ(e.httpStatusCode(), 400);
    ASSERT_TRUE(e.hint().has_value());
    EXPECT_EQ(e.hint().value(), std::string("Check the `grant_type` parameter"));
}

TEST(Errors, InvalidRequest_ExplicitHintUsedVerbatim) {
    auto e = invalidRequest("scope", {.hint = "custom hint"});
    ASSERT_TRUE(e.hint().has_value());
    EXPECT_EQ(e.hint().value(), std::string("custom hint"));
}

TEST(Errors, InvalidRequest_IgnoresRedirectUri) {
    auto e = invalidRequest("code", {.redirectUri = "https://client.example/cb"});
    EXPECT_FALSE(e.redirectUri().has_value());
}

TEST(Errors, InvalidClient) {
    auto e = invalidClient();
    EXPECT_EQ(static_cast<int>(e.code()), 4);
    EXPECT_EQ(e.type(), ErrorType::InvalidClient);
    EXPECT_EQ(e.errorType(), std::string("invalid_client"));
    EXPECT_EQ(e.httpStatusCode(), 401);
    EXPECT_FALSE(e.hint().has_value());
    EXPECT_EQ(e.message(), std::string("Client authentication failed"));
}

TEST(Errors, InvalidScope_WithRedirect) {
    auto e = invalidScope("email", {.redirectUri = "https://client.example/cb?foo=bar"});
    EXPECT_EQ(static_cast<int>(e.code()), 5);
    EXPECT_EQ(e.errorType(), std::string("invalid_scope"));
    EXPECT_EQ(e.httpStatusCode(), 400);
    EXPECT_EQ(e.hint().value(), std::string("Check the `email` scope"));
    ASSERT_TRUE(e.redirectUri().has_value());
    EXPECT_EQ(e.redirectUri().value(), std::string("https://client.example/cb?foo=bar"));
}

TEST(Errors, InvalidScope_WithoutRedirect) {
    auto e = invalidScope("admin");
    EXPECT_FALSE(e.redirectUri().has_value());
    EXPECT_EQ(e.hint().value(), std::string("Check the `admin` scope"));
}

TEST(Errors, InvalidCredentials) {
    auto e = invalidCredentials();
    EXPECT_EQ(static_cast<int>(e.code()), 6);
    EXPECT_EQ(e.errorType(), std::string("invalid_credentials"));
    EXPECT_EQ(e.httpStatusCode(), 401);
    EXPECT_FALSE(e.hint().has_value());
}

TEST(Errors, ServerError_HintGoesIntoMessage) {
    auto e = serverError("database unreachable");
    EXPECT_EQ(static_cast<int>(e.code()), 7);
    EXPECT_EQ(e.errorType(), std::string("server_error"));
    EXPECT_EQ(e.httpStatusCode(), 500);
    EXPECT_NE(e.message().find("database unreachable"), std::string::npos);
    EXPECT_FALSE(e.hint().has_value());
}

TEST(Errors, InvalidRefreshToken) {
    auto e = invalidRefreshToken({.hint = "Token has been revoked"});
    EXPECT_EQ(static_cast<int>(e.code()), 8);
    EXPECT_EQ(e.errorType(), std::string("invalid_request"));
    EXPECT_EQ(e.httpStatusCode(), 400);
    EXPECT_EQ(e.hint().value(), std::string("Token has been revoked"));
    EXPECT_EQ(e.message(), std::string("The refresh token is invalid."));

    EXPECT_FALSE(invalidRefreshToken().hint().has_value());
}

TEST(Errors, AccessDenied) {
    auto e = accessDenied({.hint = "The user denied the request", .redirectUri = "https://client.example/cb"});
    EXPECT_EQ(static_cast<int>(e.code()), 9);
    EXPECT_EQ(e.errorType(), std::string("access_denied"));
    EXPECT_EQ(e.httpStatusCode(), 401);
    EXPECT_EQ(e.hint().value(), std::string("The user denied the request"));
    EXPECT_EQ(e.redirectUri().value(), std::string("https://client.example/cb"));

    auto bare = accessDenied();
    EXPECT_FALSE(bare.hint().has_value());
    EXPECT_FALSE(bare.redirectUri().has_value());
}

TEST(Errors, RepeatedCallsAreValueEqual) {
    EXPECT_EQ(invalidGrant(), invalidGrant());
    EXPECT_EQ(invalidRequest("x"), invalidRequest("x"));
    EXPECT_EQ(invalidScope("a", {.redirectUri = "https://c/cb"}), invalidScope("a", {.redirectUri = "https://c/cb"}));
    EXPECT_EQ(serverError("boom"), serverError("boom"));
    EXPECT_FALSE(invalidRequest("x") == invalidRequest("y"));
    EXPECT_FALSE(invalidRefreshToken() == invalidRequest("refresh_token"));
}

TEST(Errors, CodesAreDistinct) {
    const ProtocolError all[] = {
        invalidGrant(), unsupportedGrantType(), invalidRequest("p"), invalidClient(), invalidScope("s"),
        invalidCredentials(), serverError("h"), invalidRefreshToken(), accessDenied()
    };
    for (size_t i = 0; i < 9; ++i) {
        EXPECT_EQ(static_cast<int>(all[i].code()), static_cast<int>(i + 1));
        EXPECT_FALSE(all[i].message().empty());
    }
}

TEST(Errors, ConstructorRejectsInvalidStatusAndEmptyMessage) {
    EXPECT_THROW((void)ProtocolError(ErrorCode::InvalidGrant, ErrorType::InvalidGrant, 404, "msg"), std::invalid_argument);
    EXPECT_THROW((void)ProtocolError(ErrorCode::InvalidGrant, ErrorType::InvalidGrant, 400, ""), std::invalid_argument);
    EXPECT_NO_THROW((void)ProtocolError(ErrorCode::InvalidGrant, ErrorType::InvalidGrant, 400, "msg"));
}

TEST(Errors, ErrorTypeNames) {
    EXPECT_STREQ(errorTypeToString(ErrorType::InvalidGrant), "invalid_grant");
    EXPECT_STREQ(errorTypeToString(ErrorType::UnsupportedGrantType), "unsupported_grant_type");
    EXPECT_STREQ(errorTypeToString(ErrorType::InvalidRequest), "invalid_request");
    EXPECT_STREQ(errorTypeToString(ErrorType::InvalidClient), "invalid_client");
    EXPECT_STREQ(errorTypeToString(ErrorType::InvalidScope), "invalid_scope");
    EXPECT_STREQ(errorTypeToString(ErrorType::InvalidCredentials), "invalid_credentials");
    EXPECT_STREQ(errorTypeToString(ErrorType::ServerError), "server_error");
    EXPECT_STREQ(errorTypeToString(ErrorType::AccessDenied), "access_denied");
}

TEST(OAuthServerException, CarriesErrorAndMessage) {
    try {
        throw OAuthServerException(invalidCredentials());
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()), std::string("The user credentials were incorrect."));
        const auto* oauthEx = dynamic_cast<const OAuthServerException*>(&e);
        ASSERT_NE(oauthEx, nullptr);
        EXPECT_EQ(oauthEx->error(), invalidCredentials());
    }
}
