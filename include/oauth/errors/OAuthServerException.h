//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthServerException.h
// Purpose: Throwable carrier for a ProtocolError, caught and rendered at the endpoint boundary
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <utility>

#include "oauth/errors/ProtocolError.h"

namespace oauth {
namespace errors {

//==========================================================================================================
// OAuthServerException
// Purpose: Lets grant and validation code abort with a classified failure.
// Notes:
//   - what() returns the error message.
//==========================================================================================================
class OAuthServerException : public std::runtime_error {
public:
    explicit OAuthServerException(ProtocolError error)
        : std::runtime_error(error.message()), error_(std::move(error)) {}

    const ProtocolError& error() const noexcept { return error_; }

private:
    ProtocolError error_;
};

} // namespace errors
} // namespace oauth
