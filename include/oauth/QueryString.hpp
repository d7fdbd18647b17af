//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: QueryString.hpp
// Purpose: application/x-www-form-urlencoded encode/decode of ordered string parameters
//==========================================================================================================

#pragma once

#include <string>
#include <utility>
#include <vector>

namespace oauth {

// Ordered key/value parameters; keys are unique after parseQueryString/mergeQueryParams.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

//==========================================================================================================
// urlEncodeForm
// Purpose: Percent-encode a component for form encoding. Unreserved characters pass through and space
//          becomes '+'.
//==========================================================================================================
std::string urlEncodeForm(const std::string& s);

//==========================================================================================================
// urlDecodeForm
// Purpose: Reverse of urlEncodeForm. '+' decodes to space; malformed %-sequences are kept literally.
//==========================================================================================================
std::string urlDecodeForm(const std::string& s);

//==========================================================================================================
// parseQueryString
// Purpose: Decode "a=1&b=2" into ordered parameters.
// Notes:
//   - A leading '?' is ignored, empty segments are skipped, "flag" decodes to {"flag", ""}.
//   - A repeated key keeps its first position and takes the last value.
//==========================================================================================================
QueryParams parseQueryString(const std::string& query);

//==========================================================================================================
// buildQueryString
// Purpose: Encode ordered parameters as "k=v&k2=v2" with form encoding.
//==========================================================================================================
std::string buildQueryString(const QueryParams& params);

//==========================================================================================================
// mergeQueryParams
// Purpose: Overlay `overrides` onto `base`. A key already in base is replaced in place, new keys are
//          appended in the order given.
//==========================================================================================================
QueryParams mergeQueryParams(QueryParams base, const QueryParams& overrides);

} // namespace oauth
