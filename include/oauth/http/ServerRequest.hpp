//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRequest.hpp
// Purpose: Inbound request context: the Beast request plus server-side basic-auth parameters
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oauth/http/HttpMessage.hpp"

namespace oauth {

//==========================================================================================================
// ServerParams
// Purpose: Authentication variables a web server derives from the request before handlers run.
// Fields:
//   authUser: Basic-auth user name; absent when the client did not send usable Basic credentials.
//   authPassword: Basic-auth password (may be empty when the user name is present).
//==========================================================================================================
struct ServerParams {
    std::optional<std::string> authUser;
    std::optional<std::string> authPassword;
};

//==========================================================================================================
// ServerRequest
// Purpose: The original inbound request as seen by the error responder.
//==========================================================================================================
struct ServerRequest {
    HttpRequest message;
    ServerParams serverParams;

    //==========================================================================================================
    // fromMessage
    // Purpose: Wrap a Beast request, filling serverParams from an "Authorization: Basic <b64>" header.
    // Notes:
    //   - Undecodable base64 or a payload without ':' leaves serverParams empty.
    //==========================================================================================================
    static ServerRequest fromMessage(HttpRequest message);

    //==========================================================================================================
    // authorizationHeader
    // Purpose: First Authorization header value, or std::nullopt when the header is missing.
    //==========================================================================================================
    std::optional<std::string> authorizationHeader() const;
};

//==========================================================================================================
// decodeBase64
// Purpose: Standard-alphabet base64 decode ('=' padding optional).
// Returns:
//   Decoded bytes, or std::nullopt on characters outside the alphabet or a dangling final sextet.
//==========================================================================================================
std::optional<std::string> decodeBase64(const std::string& in);

} // namespace oauth
