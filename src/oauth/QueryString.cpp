//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauth/QueryString.cpp
// Purpose: Form-encoded query string codec
//==========================================================================================================

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

#include "oauth/QueryString.hpp"

namespace oauth {

namespace {
    static int hexValue(char h) {
        if (h >= '0' && h <= '9') return h - '0';
        if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
        if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
        return -1;
    }

    static void setParam(QueryParams& params, std::string key, std::string value) {
        auto it = std::find_if(params.begin(), params.end(),
                               [&key](const auto& kv){ return kv.first == key; });
        if (it != params.end()) {
            it->second = std::move(value);
        } else {
            params.emplace_back(std::move(key), std::move(value));
        }
    }
}

std::string urlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string urlDecodeForm(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < s.size() &&
                   hexValue(s[i + 1]) >= 0 && hexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>((hexValue(s[i + 1]) << 4) | hexValue(s[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

QueryParams parseQueryString(const std::string& query) {
    QueryParams params;
    std::string q = (!query.empty() && query.front() == '?') ? query.substr(1) : query;
    std::stringstream ss(q);
    std::string kv;
    while (std::getline(ss, kv, '&')) {
        if (kv.empty()) {
            continue;
        }
        auto eq = kv.find('=');
        std::string key = urlDecodeForm((eq == std::string::npos) ? kv : kv.substr(0, eq));
        std::string val = (eq == std::string::npos) ? std::string() : urlDecodeForm(kv.substr(eq + 1));
        if (key.empty()) {
            continue;
        }
        setParam(params, std::move(key), std::move(val));
    }
    return params;
}

std::string buildQueryString(const QueryParams& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << '&';
        first = false;
        oss << urlEncodeForm(key) << '=' << urlEncodeForm(value);
    }
    return oss.str();
}

QueryParams mergeQueryParams(QueryParams base, const QueryParams& overrides) {
    for (const auto& [key, value] : overrides) {
        setParam(base, key, value);
    }
    return base;
}

} // namespace oauth
