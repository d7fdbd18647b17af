//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_redirect_delivery.cpp
// Purpose: GoogleTests for merging error parameters into redirect URIs (query and fragment delivery)
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "oauth/ErrorResponder.hpp"
#include "oauth/QueryString.hpp"
#include "oauth/Uri.hpp"
#include "oauth/errors/Errors.h"

using namespace oauth;

namespace {
const std::string kScopeMessage = "message=The+requested+scope+is+invalid%2C+unknown%2C+or+malformed";
const std::string kEmailHint = "hint=Check+the+%60email%60+scope";
}

TEST(RedirectDelivery, QueryModePreservesExistingParameters) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example/cb?foo=bar"});
    auto res = generateHttpResponse(err);

    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(std::string(res[http::field::location]),
              "https://client.example/cb?foo=bar&error=invalid_scope&" + kScopeMessage + "&" + kEmailHint);

    Uri location = Uri::parse(std::string(res[http::field::location]));
    QueryParams q = parseQueryString(location.query());
    ASSERT_EQ(q.size(), 4u);
    EXPECT_EQ(q[0], (std::pair<std::string, std::string>("foo", "bar")));
    EXPECT_EQ(q[1].second, std::string("invalid_scope"));
    EXPECT_EQ(q[3].second, std::string("Check the `email` scope"));
    EXPECT_TRUE(location.fragment().empty());
}

TEST(RedirectDelivery, FragmentModeLeavesQueryUntouched) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example/cb?foo=bar"});
    RenderOptions opts; opts.useFragment = true;
    auto res = generateHttpResponse(err, opts);

    Uri location = Uri::parse(std::string(res[http::field::location]));
    EXPECT_EQ(location.query(), std::string("foo=bar"));
    QueryParams f = parseQueryString(location.fragment());
    ASSERT_EQ(f.size(), 4u);
    EXPECT_EQ(f[1], (std::pair<std::string, std::string>("error", "invalid_scope")));
    EXPECT_EQ(f[2].first, std::string("message"));
    EXPECT_EQ(f[3], (std::pair<std::string, std::string>("hint", "Check the `email` scope")));
    EXPECT_EQ(std::string(res[http::field::location]),
              "https://client.example/cb?foo=bar#foo=bar&error=invalid_scope&" + kScopeMessage + "&" + kEmailHint);
}

TEST(RedirectDelivery, BodyStillWrittenWhenRedirecting) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example/cb"});
    auto res = generateHttpResponse(err);
    JSONValue body = parseJSON(res.body());
    const auto& obj = std::get<JSONValue::Object>(body.value);
    EXPECT_EQ(obj.size(), 3u);
    EXPECT_EQ(std::string(res[http::field::content_type]), std::string("application/json"));
}

TEST(RedirectDelivery, UriWithoutQuery) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example/cb"});
    auto res = generateHttpResponse(err);
    EXPECT_EQ(std::string(res[http::field::location]),
              "https://client.example/cb?error=invalid_scope&" + kScopeMessage + "&" + kEmailHint);
}

TEST(RedirectDelivery, PayloadOverwritesCollidingParameterInPlace) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example/cb?error=old&state=s1"});
    auto res = generateHttpResponse(err);
    EXPECT_EQ(std::string(res[http::field::location]),
              "https://client.example/cb?error=invalid_scope&state=s1&" + kScopeMessage + "&" + kEmailHint);
}

TEST(RedirectDelivery, FragmentModeReplacesExistingFragment) {
    auto err = errors::accessDenied({.redirectUri = "myapp://callback#old"});
    RenderOptions opts; opts.useFragment = true;
    auto res = generateHttpResponse(err, opts);
    EXPECT_EQ(res.result_int(), 401u);
    EXPECT_EQ(std::string(res[http::field::location]),
              std::string("myapp://callback#error=access_denied&message=The+resource+owner+or+authorization+server+denied+the+request."));
}

TEST(RedirectDelivery, NoRedirectUriMeansNoLocation) {
    auto res = generateHttpResponse(errors::accessDenied({.hint = "denied"}));
    EXPECT_TRUE(res.find(http::field::location) == res.end());
}

TEST(RedirectDelivery, MalformedRedirectUriPropagates) {
    auto err = errors::invalidScope("email", {.redirectUri = "https://client.example:99999/cb"});
    EXPECT_THROW(generateHttpResponse(err), UriError);

    auto spaced = errors::accessDenied({.redirectUri = "https://client.example/c b"});
    EXPECT_THROW(generateHttpResponse(spaced), std::invalid_argument);
}

TEST(RedirectDelivery, BuildRedirectLocationDirect) {
    QueryParams params{{"error", "access_denied"}, {"state", "a b"}};
    EXPECT_EQ(buildRedirectLocation("https://c.example/cb?x=1", params, false),
              std::string("https://c.example/cb?x=1&error=access_denied&state=a+b"));
    EXPECT_EQ(buildRedirectLocation("https://c.example/cb?x=1", params, true),
              std::string("https://c.example/cb?x=1#x=1&error=access_denied&state=a+b"));
}
