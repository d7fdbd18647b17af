//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Uri.hpp
// Purpose: Immutable URI value (RFC 3986 component split) used to rewrite redirect targets
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace oauth {

//==========================================================================================================
// UriError
// Purpose: Thrown when a string cannot be split into URI components.
//==========================================================================================================
class UriError : public std::invalid_argument {
public:
    explicit UriError(const std::string& what) : std::invalid_argument(what) {}
};

//==========================================================================================================
// Uri
// Purpose: Parsed representation of scheme://userinfo@host:port/path?query#fragment.
// Notes:
//   - Components are stored as transmitted (no percent-decoding, no normalization).
//   - withQuery/withFragment return a new Uri; a leading '?' or '#' in the argument is dropped.
//   - toString omits '?' and '#' when the query or fragment is empty.
//==========================================================================================================
class Uri {
public:
    Uri() = default;

    //==========================================================================================================
    // parse
    // Purpose: Split a URI reference into components.
    // Throws:
    //   UriError for control characters or spaces, an invalid scheme, a non-numeric or out-of-range port,
    //   or an http(s) authority without a host.
    //==========================================================================================================
    static Uri parse(const std::string& text);

    const std::string& scheme() const { return scheme_; }
    const std::string& userInfo() const { return userInfo_; }
    const std::string& host() const { return host_; }
    const std::optional<unsigned int>& port() const { return port_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }
    const std::string& fragment() const { return fragment_; }

    // "userinfo@host:port", empty when the URI has no authority
    std::string authority() const;

    Uri withQuery(const std::string& query) const;
    Uri withFragment(const std::string& fragment) const;

    std::string toString() const;

private:
    std::string scheme_;
    std::string userInfo_;
    std::string host_;
    std::optional<unsigned int> port_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    bool hasAuthority_{false};
};

} // namespace oauth
