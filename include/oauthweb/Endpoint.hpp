//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Endpoint.hpp
// Purpose: Capability contracts between the HTTP adapter and the OAuth2 endpoint engine
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "oauthweb/NormalizedParameter.hpp"
#include "oauthweb/errors/OAuthError.hpp"
#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {

//==========================================================================================================
// IWebRequest
// Purpose: Normalized view of an incoming request as consumed by the engine.
// Notes:
//   - Query() and UrlBody() throw WebError (Query / Body) when the field is absent or was unparseable.
//   - AuthHeader() returns std::nullopt when no Authorization header was sent.
//==========================================================================================================
class IWebRequest {
public:
    virtual ~IWebRequest() = default;
    virtual const NormalizedParameter& Query() = 0;
    virtual const NormalizedParameter& UrlBody() = 0;
    virtual std::optional<std::string> AuthHeader() = 0;
};

//==========================================================================================================
// IWebResponse
// Purpose: Response actions dictated by the engine. Each action may throw WebError (Header) when a header
//          value cannot be constructed.
//==========================================================================================================
class IWebResponse {
public:
    virtual ~IWebResponse() = default;
    virtual void Ok() = 0;
    virtual void Redirect(const std::string& url) = 0;
    virtual void ClientError() = 0;
    virtual void Unauthorized(const std::string& kind) = 0;
    virtual void BodyText(const std::string& text) = 0;
    virtual void BodyJson(const std::string& json) = 0;
};

//==========================================================================================================
// Grant
// Purpose: Authorization attached to a valid access token, returned by a successful resource check.
//==========================================================================================================
struct Grant {
    std::string ownerId;
    std::string clientId;
    std::string scope;
    std::string redirectUri;
    std::chrono::system_clock::time_point until;
};

//==========================================================================================================
// IEndpoint
// Purpose: Protocol engine boundary. Implementations decide grants and issue tokens; this library only
//          carries data to and from them.
// Errors:
//   - Protocol failures are thrown as EndpointError.
//   - WebError raised by the request/response capabilities propagates unchanged.
//==========================================================================================================
class IEndpoint {
public:
    virtual ~IEndpoint() = default;

    // Authorization code flow, front channel.
    virtual void Authorize(IWebRequest& request, IWebResponse& response) = 0;

    // Token endpoint: exchange an authorization code.
    virtual void AccessToken(IWebRequest& request, IWebResponse& response) = 0;

    // Token endpoint: refresh grant.
    virtual void Refresh(IWebRequest& request, IWebResponse& response) = 0;

    //==========================================================================================================
    // Resource
    // Purpose: Check the bearer token of a request guarding a protected resource.
    // Returns:
    //   The grant when access is allowed; std::nullopt when denied, in which case response has been filled
    //   with the denial (typically 401 with WWW-Authenticate).
    //==========================================================================================================
    virtual std::optional<Grant> Resource(IWebRequest& request, IWebResponse& response) = 0;
};

} // namespace oauthweb
