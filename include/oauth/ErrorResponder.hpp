//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorResponder.hpp
// Purpose: Render a ProtocolError as an RFC 6749 section 5.2 HTTP response (JSON body, headers, redirect)
//==========================================================================================================

#pragma once

#include "oauth/JSONValue.h"
#include "oauth/QueryString.hpp"
#include "oauth/errors/ProtocolError.h"
#include "oauth/http/HttpMessage.hpp"
#include "oauth/http/ServerRequest.hpp"

namespace oauth {

//==========================================================================================================
// RenderOptions
// Purpose: Per-call rendering configuration.
// Fields:
//   useFragment: Merge error parameters into the redirect URI fragment instead of its query.
//   request: Original inbound request; consulted only for invalid_client challenges. May be null.
//            Non-owning; must stay valid for the duration of the call.
//==========================================================================================================
struct RenderOptions {
    bool useFragment{false};
    const ServerRequest* request{nullptr};
};

//==========================================================================================================
// buildErrorPayload
// Purpose: JSON object {"error", "message", "hint"?} for the error. No other keys are ever present.
//==========================================================================================================
JSONValue buildErrorPayload(const errors::ProtocolError& error);

//==========================================================================================================
// buildErrorParams
// Purpose: The same payload as ordered parameters (error, message, hint) for redirect delivery.
//==========================================================================================================
QueryParams buildErrorParams(const errors::ProtocolError& error);

//==========================================================================================================
// buildRedirectLocation
// Purpose: Merge the error parameters into the redirect URI.
// Args:
//   redirectUri: Client redirect target; its existing query parameters are preserved unless a payload key
//                collides with them.
//   params: Parameters to merge (payload wins on collision).
//   useFragment: Write the merged parameters to the fragment, leaving the query as it was.
// Throws:
//   UriError when redirectUri cannot be parsed.
//==========================================================================================================
std::string buildRedirectLocation(const std::string& redirectUri, const QueryParams& params, bool useFragment);

//==========================================================================================================
// getHttpHeaders
// Purpose: Headers for the error response without rendering it.
// Returns:
//   Content-Type: application/json always; WWW-Authenticate only for invalid_client when request is
//   non-null and names a recognizable scheme.
//==========================================================================================================
HttpHeaders getHttpHeaders(const errors::ProtocolError& error, const ServerRequest* request = nullptr);

//==========================================================================================================
// generateHttpResponse
// Purpose: Render the error into a fresh default response, or into the supplied in-flight response.
// Notes:
//   - The JSON body is appended to any existing body and written even when a Location header is set.
//   - The returned response carries the error's status code.
// Throws:
//   UriError when the error's redirect URI is malformed; nothing partial is returned.
//==========================================================================================================
HttpResponse generateHttpResponse(const errors::ProtocolError& error, const RenderOptions& opts = {});
HttpResponse generateHttpResponse(const errors::ProtocolError& error,
                                  HttpResponse response,
                                  const RenderOptions& opts = {});

} // namespace oauth
