//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/Uri.cpp
// Purpose: URI component parsing and serialization
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <string>

#include "oauth/Uri.hpp"

namespace oauth {

namespace {
    static bool isSchemeChar(char c) {
        unsigned char ch = static_cast<unsigned char>(c);
        return std::isalnum(ch) != 0 || c == '+' || c == '-' || c == '.';
    }

    static std::string toLower(std::string s) {
        for (size_t i = 0; i < s.size(); ++i) {
            s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
        }
        return s;
    }

    static unsigned int parsePort(const std::string& text, const std::string& uri) {
        bool allDigits = !text.empty() &&
            std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || text.size() > 5) {
            throw UriError(std::string("Invalid port in URI: ") + uri);
        }
        unsigned long portNum = std::stoul(text);
        if (portNum > 65535ul) {
            throw UriError(std::string("Port out of range in URI: ") + uri);
        }
        return static_cast<unsigned int>(portNum);
    }
}

Uri Uri::parse(const std::string& text) {
    for (char c : text) {
        unsigned char ch = static_cast<unsigned char>(c);
        if (ch <= 0x20 || ch == 0x7F) {
            throw UriError(std::string("URI contains whitespace or control characters: ") + text);
        }
    }

    Uri u;
    std::string rest = text;

    // Fragment and query are split off first; everything before them is scheme/authority/path
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        u.fragment_ = rest.substr(hash + 1);
        rest.erase(hash);
    }
    auto qpos = rest.find('?');
    if (qpos != std::string::npos) {
        u.query_ = rest.substr(qpos + 1);
        rest.erase(qpos);
    }

    // Scheme: first ':' before any '/', must start with a letter
    auto colon = rest.find(':');
    auto slash = rest.find('/');
    if (colon != std::string::npos && (slash == std::string::npos || colon < slash)) {
        std::string scheme = rest.substr(0, colon);
        if (scheme.empty() || std::isalpha(static_cast<unsigned char>(scheme.front())) == 0 ||
            !std::all_of(scheme.begin(), scheme.end(), isSchemeChar)) {
            throw UriError(std::string("Invalid URI scheme: ") + text);
        }
        u.scheme_ = toLower(scheme);
        rest = rest.substr(colon + 1);
    }

    if (rest.rfind("//", 0) == 0) {
        u.hasAuthority_ = true;
        rest = rest.substr(2);
        auto pathStart = rest.find('/');
        std::string authority = (pathStart == std::string::npos) ? rest : rest.substr(0, pathStart);
        u.path_ = (pathStart == std::string::npos) ? std::string() : rest.substr(pathStart);

        auto at = authority.rfind('@');
        if (at != std::string::npos) {
            u.userInfo_ = authority.substr(0, at);
            authority = authority.substr(at + 1);
        }

        // host[:port] including IPv6 in [addr]:port form
        std::string portText;
        bool hasPort = false;
        if (!authority.empty() && authority.front() == '[') {
            auto rb = authority.find(']');
            if (rb == std::string::npos) {
                throw UriError(std::string("Unterminated IPv6 host in URI: ") + text);
            }
            u.host_ = authority.substr(0, rb + 1);
            if (rb + 1 < authority.size()) {
                if (authority[rb + 1] != ':') {
                    throw UriError(std::string("Invalid authority in URI: ") + text);
                }
                hasPort = true;
                portText = authority.substr(rb + 2);
            }
        } else {
            auto pc = authority.rfind(':');
            if (pc != std::string::npos) {
                hasPort = true;
                portText = authority.substr(pc + 1);
                u.host_ = authority.substr(0, pc);
            } else {
                u.host_ = authority;
            }
        }
        u.host_ = toLower(u.host_);
        if (hasPort && !portText.empty()) {
            u.port_ = parsePort(portText, text);
        }
        if (u.host_.empty() && (u.scheme_ == "http" || u.scheme_ == "https")) {
            throw UriError(std::string("URI has an empty host: ") + text);
        }
    } else {
        u.path_ = rest;
    }
    return u;
}

std::string Uri::authority() const {
    if (!hasAuthority_) {
        return std::string();
    }
    std::string out;
    if (!userInfo_.empty()) {
        out += userInfo_ + "@";
    }
    out += host_;
    if (port_.has_value()) {
        out += ":" + std::to_string(port_.value());
    }
    return out;
}

Uri Uri::withQuery(const std::string& query) const {
    Uri u = *this;
    u.query_ = (!query.empty() && query.front() == '?') ? query.substr(1) : query;
    return u;
}

Uri Uri::withFragment(const std::string& fragment) const {
    Uri u = *this;
    u.fragment_ = (!fragment.empty() && fragment.front() == '#') ? fragment.substr(1) : fragment;
    return u;
}

std::string Uri::toString() const {
    std::string out;
    if (!scheme_.empty()) {
        out += scheme_ + ":";
    }
    if (hasAuthority_) {
        out += "//" + authority();
    }
    out += path_;
    if (!query_.empty()) {
        out += "?" + query_;
    }
    if (!fragment_.empty()) {
        out += "#" + fragment_;
    }
    return out;
}

} // namespace oauth
