//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthRequest.hpp
// Purpose: Request adapters turning Boost.Beast requests into the engine's normalized request
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oauthweb/Endpoint.hpp"
#include "oauthweb/HttpTypes.hpp"
#include "oauthweb/NormalizedParameter.hpp"
#include "oauthweb/UrlEncoded.hpp"

namespace oauthweb {

class OAuthResource;

//==========================================================================================================
// OAuthRequest
// Purpose: Normalized request implementing IWebRequest.
// Notes:
//   - More than one Authorization header is rejected at construction.
//   - Query and body parse failures are not fatal here: the field is stored as absent and the Query/Body
//     error is raised only when Query()/UrlBody() is called. Handlers that never read a field never see
//     its error.
//   - The form body is parsed once from the already-read request body; it is not read again.
//==========================================================================================================
class OAuthRequest : public IWebRequest {
public:
    OAuthRequest() = default;
    OAuthRequest(std::optional<std::string> auth,
                 std::optional<NormalizedParameter> query,
                 std::optional<NormalizedParameter> body);

    //==========================================================================================================
    // FromHttp
    // Purpose: Build from a framework request.
    // Args:
    //   request: Beast request with its body already read.
    //   formLimit: Maximum accepted form body size.
    // Throws:
    //   WebError (Authorization) when more than one Authorization header is present.
    //==========================================================================================================
    static OAuthRequest FromHttp(const HttpRequest& request, std::size_t formLimit = formLimitFromEnv());

    ////////////////////////////////////////// IWebRequest //////////////////////////////////////////
    const NormalizedParameter& Query() override;
    const NormalizedParameter& UrlBody() override;
    std::optional<std::string> AuthHeader() override;

    // Non-failing views.
    const std::optional<std::string>& AuthorizationHeader() const { return auth; }
    const std::optional<NormalizedParameter>& QueryParams() const { return query; }
    std::optional<NormalizedParameter>& MutableQuery() { return query; }
    const std::optional<NormalizedParameter>& BodyParams() const { return body; }

private:
    std::optional<std::string> auth;
    std::optional<NormalizedParameter> query;
    std::optional<NormalizedParameter> body;
    ParseStatus queryStatus{ParseStatus::Ok};
    ParseStatus bodyStatus{ParseStatus::Ok};
};

//==========================================================================================================
// OAuthResource
// Purpose: Header-only adapter for guarding resources. Reads the Authorization header and nothing else, so
//          the request body stays available to the application handler.
//==========================================================================================================
class OAuthResource {
public:
    explicit OAuthResource(std::optional<std::string> auth) : auth(std::move(auth)) {}

    // Throws WebError (Authorization) when more than one Authorization header is present.
    static OAuthResource FromHttp(const HttpRequest& request);

    const std::optional<std::string>& AuthorizationHeader() const { return auth; }

    // Full request with query and body absent.
    OAuthRequest IntoRequest() &&;
    operator OAuthRequest() && { return std::move(*this).IntoRequest(); }

private:
    std::optional<std::string> auth;
};

} // namespace oauthweb
