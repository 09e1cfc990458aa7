//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OAuthResponse.hpp
// Purpose: Response builder accumulating engine-dictated actions into status, headers and body
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oauthweb/Endpoint.hpp"
#include "oauthweb/HttpTypes.hpp"

namespace oauthweb {

//==========================================================================================================
// OAuthResponse
// Purpose: IWebResponse implementation. Starts as 200 with no headers and no body.
// Notes:
//   - Each action sets the status and the single header it owns; headers set by earlier actions are kept
//     unless the action overwrites the same field.
//   - Redirect/Unauthorized validate their header value first; on failure nothing is modified.
//==========================================================================================================
class OAuthResponse : public IWebResponse {
public:
    OAuthResponse() = default;

    // 200 OK, no headers, no body.
    static OAuthResponse MakeOk() { return OAuthResponse(); }

    // Fluent helpers for handlers composing a response by hand. WithContentType throws WebError (Header).
    OAuthResponse& WithContentType(const std::string& contentType);
    OAuthResponse& WithBody(const std::string& text);

    ////////////////////////////////////////// IWebResponse //////////////////////////////////////////
    void Ok() override;
    void Redirect(const std::string& url) override;
    void ClientError() override;
    void Unauthorized(const std::string& kind) override;
    void BodyText(const std::string& text) override;
    void BodyJson(const std::string& json) override;

    http::status Status() const { return status; }
    const http::fields& Headers() const { return headers; }
    const std::optional<std::string>& Body() const { return body; }

    //==========================================================================================================
    // ToHttp
    // Purpose: Finalize into a framework response. Headers are copied verbatim; the body is set when
    //          present, otherwise left empty.
    // Args:
    //   version: HTTP version of the originating request (e.g. 11).
    //==========================================================================================================
    HttpResponse ToHttp(unsigned int version = 11) const;

private:
    http::status status{http::status::ok};
    http::fields headers;
    std::optional<std::string> body;
};

} // namespace oauthweb
