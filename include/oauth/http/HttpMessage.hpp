//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpMessage.hpp
// Purpose: Boost.Beast message aliases and value-style response transformations
//==========================================================================================================

#pragma once

#include <map>
#include <string>
#include <utility>

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace oauth {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

// Header name -> value; names compare case-insensitively
using HttpHeaders = std::map<std::string, std::string, boost::beast::iless>;

//==========================================================================================================
// makeDefaultResponse
// Purpose: Fresh "200 OK" HTTP/1.1 response with an empty body.
//==========================================================================================================
inline HttpResponse makeDefaultResponse() {
    return HttpResponse{http::status::ok, 11};
}

//==========================================================================================================
// Value-style transformations
// Purpose: Each step consumes a response and returns the next version of it.
//==========================================================================================================
inline HttpResponse withHeader(HttpResponse res, const std::string& name, const std::string& value) {
    res.set(name, value);
    return res;
}

inline HttpResponse withAppendedBody(HttpResponse res, const std::string& bytes) {
    res.body() += bytes;
    return res;
}

inline HttpResponse withStatus(HttpResponse res, unsigned int status) {
    res.result(status);
    return res;
}

} // namespace oauth
