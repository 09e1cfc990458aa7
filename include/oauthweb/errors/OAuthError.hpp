//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthError.hpp
// Purpose: Protocol-level error codes raised by the OAuth2 endpoint engine
//==========================================================================================================

#pragma once

#include <stdexcept>
#include <string>

namespace oauthweb {

// Protocol failures reported by the engine.
enum class OAuthError {
    DenySilently,   // Request looks like an attack; answer without detail
    PrimitiveError, // A server-side primitive (registrar, authorizer, issuer) failed
    BadRequest      // Request was malformed from a protocol point of view
};

const char* describe(OAuthError error);

//==========================================================================================================
// EndpointError
// Purpose: Exception thrown by IEndpoint implementations to report a protocol failure. Operations convert
//          it into WebError with kind Endpoint.
//==========================================================================================================
class EndpointError : public std::runtime_error {
public:
    explicit EndpointError(OAuthError code)
        : std::runtime_error(describe(code)), code(code) {}

    OAuthError Code() const noexcept { return code; }

private:
    OAuthError code;
};

} // namespace oauthweb
