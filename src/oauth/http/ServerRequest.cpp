//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/http/ServerRequest.cpp
// Purpose: Request context construction and Basic credential extraction
//==========================================================================================================

#include <cctype>
#include <string>
#include <utility>

#include "logging/Logger.h"
#include "oauth/http/ServerRequest.hpp"

namespace oauth {

namespace {
    static bool icaseEqual(char a, char b) {
        return (std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)));
    }

    static bool startsWithBasic(const std::string& s) {
        const std::string pfx = "Basic ";
        if (s.size() < pfx.size()) {
            return false;
        }
        for (size_t i = 0; i < pfx.size(); ++i) {
            if (!icaseEqual(s[i], pfx[i])) {
                return false;
            }
        }
        return true;
    }

    static int base64Value(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return 26 + (c - 'a');
        if (c >= '0' && c <= '9') return 52 + (c - '0');
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    }
}

std::optional<std::string> decodeBase64(const std::string& in) {
    std::string data = in;
    while (!data.empty() && data.back() == '=') {
        data.pop_back();
    }
    if (data.size() % 4 == 1) {
        return std::nullopt;
    }
    std::string out;
    out.reserve((data.size() * 3) / 4);
    unsigned int acc = 0;
    int bits = 0;
    for (char c : data) {
        int v = base64Value(c);
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFFu));
        }
    }
    return out;
}

ServerRequest ServerRequest::fromMessage(HttpRequest message) {
    ServerRequest req;
    req.message = std::move(message);

    auto header = req.authorizationHeader();
    if (!header.has_value() || !startsWithBasic(header.value())) {
        return req;
    }

    std::string encoded = header.value().substr(6);
    while (!encoded.empty() && std::isspace(static_cast<unsigned char>(encoded.front())) != 0) {
        encoded.erase(encoded.begin());
    }
    while (!encoded.empty() && std::isspace(static_cast<unsigned char>(encoded.back())) != 0) {
        encoded.pop_back();
    }

    auto decoded = decodeBase64(encoded);
    if (!decoded.has_value()) {
        LOG_DEBUG("ServerRequest: Basic credentials are not valid base64");
        return req;
    }
    auto colon = decoded->find(':');
    if (colon == std::string::npos) {
        LOG_DEBUG("ServerRequest: Basic credentials lack a ':' separator");
        return req;
    }
    req.serverParams.authUser = decoded->substr(0, colon);
    req.serverParams.authPassword = decoded->substr(colon + 1);
    return req;
}

std::optional<std::string> ServerRequest::authorizationHeader() const {
    auto it = message.find(http::field::authorization);
    if (it == message.end()) {
        return std::nullopt;
    }
    return std::string(it->value());
}

} // namespace oauth
