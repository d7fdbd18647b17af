//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/ErrorResponder.cpp
// Purpose: ProtocolError -> HTTP response rendering
//==========================================================================================================

#include <memory>
#include <string>
#include <utility>

#include "logging/Logger.h"
#include "oauth/ErrorResponder.hpp"
#include "oauth/Uri.hpp"
#include "oauth/auth/AuthScheme.hpp"

namespace oauth {

JSONValue buildErrorPayload(const errors::ProtocolError& error) {
    JSONValue::Object obj;
    obj["error"] = std::make_shared<JSONValue>(error.errorType());
    obj["message"] = std::make_shared<JSONValue>(error.message());
    if (error.hint().has_value()) {
        obj["hint"] = std::make_shared<JSONValue>(error.hint().value());
    }
    return JSONValue{std::move(obj)};
}

QueryParams buildErrorParams(const errors::ProtocolError& error) {
    QueryParams params;
    params.emplace_back("error", error.errorType());
    params.emplace_back("message", error.message());
    if (error.hint().has_value()) {
        params.emplace_back("hint", error.hint().value());
    }
    return params;
}

std::string buildRedirectLocation(const std::string& redirectUri, const QueryParams& params, bool useFragment) {
    Uri uri = Uri::parse(redirectUri);
    QueryParams merged = mergeQueryParams(parseQueryString(uri.query()), params);
    const std::string encoded = buildQueryString(merged);
    return useFragment ? uri.withFragment(encoded).toString() : uri.withQuery(encoded).toString();
}

HttpHeaders getHttpHeaders(const errors::ProtocolError& error, const ServerRequest* request) {
    HttpHeaders headers;
    headers["Content-Type"] = "application/json";

    // RFC 6749 section 5.2: a client that attempted to authenticate must get a challenge matching the
    // scheme it used.
    if (error.type() == errors::ErrorType::InvalidClient && request != nullptr) {
        auto scheme = auth::detectAuthScheme(*request);
        if (scheme.has_value()) {
            headers["WWW-Authenticate"] = auth::buildChallenge(scheme.value());
        }
    }
    return headers;
}

HttpResponse generateHttpResponse(const errors::ProtocolError& error, const RenderOptions& opts) {
    return generateHttpResponse(error, makeDefaultResponse(), opts);
}

HttpResponse generateHttpResponse(const errors::ProtocolError& error,
                                  HttpResponse response,
                                  const RenderOptions& opts) {
    LOG_DEBUG("ErrorResponder: rendering {} (code {}, status {})",
              error.errorType(), static_cast<int>(error.code()), error.httpStatusCode());
    if (error.type() == errors::ErrorType::ServerError) {
        LOG_ERROR("ErrorResponder: {}", error.message());
    }

    HttpHeaders headers = getHttpHeaders(error, opts.request);
    const std::string body = serializeJSONValue(buildErrorPayload(error));

    if (error.redirectUri().has_value()) {
        try {
            headers["Location"] = buildRedirectLocation(error.redirectUri().value(), buildErrorParams(error), opts.useFragment);
        } catch (const UriError& e) {
            LOG_ERROR("ErrorResponder: cannot redirect {} error: {}", error.errorType(), e.what());
            throw;
        }
    }

    for (const auto& [name, value] : headers) {
        response = withHeader(std::move(response), name, value);
    }
    response = withAppendedBody(std::move(response), body);
    response = withStatus(std::move(response), static_cast<unsigned int>(error.httpStatusCode()));
    response.prepare_payload();
    return response;
}

} // namespace oauth
