//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorResponse.hpp
// Purpose: Mapping of WebError kinds to HTTP status and rendering of generic failure responses
//==========================================================================================================

#pragma once

#include <map>

#include "oauthweb/HttpTypes.hpp"
#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {

//==========================================================================================================
// ErrorStatusPolicy
// Purpose: Decides the HTTP status sent for an unhandled WebError.
// Notes:
//   - Every kind maps to 500 unless overridden. This layer cannot tell which internal failures are safe to
//     disclose, so exposing a kind as 4xx is an explicit choice of the application.
//   - Endpoint errors can also be mapped by their OAuthError. That mapping is consulted first; the kind
//     mapping applies when it has no entry.
//==========================================================================================================
class ErrorStatusPolicy {
public:
    ErrorStatusPolicy() = default;

    ErrorStatusPolicy& Override(WebError::Kind kind, http::status status);
    ErrorStatusPolicy& Reset(WebError::Kind kind);

    ErrorStatusPolicy& Override(OAuthError error, http::status status);
    ErrorStatusPolicy& Reset(OAuthError error);

    http::status StatusFor(const WebError& error) const;
    http::status StatusFor(WebError::Kind kind) const;

private:
    std::map<WebError::Kind, http::status> overrides;
    std::map<OAuthError, http::status> oauthOverrides;
};

//==========================================================================================================
// renderError
// Purpose: Produce the response for an unhandled WebError. The full error is logged; the response carries
//          only the status and its reason phrase.
// Args:
//   error: The failure to render.
//   policy: Status mapping.
//   version: HTTP version of the originating request.
//==========================================================================================================
HttpResponse renderError(const WebError& error, const ErrorStatusPolicy& policy, unsigned int version = 11);

} // namespace oauthweb
