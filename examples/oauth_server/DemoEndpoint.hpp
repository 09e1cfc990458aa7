//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/oauth_server/DemoEndpoint.hpp
// Purpose: Toy in-memory endpoint engine used by the demo server
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <boost/url/param.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url.hpp>

#include "oauthweb/Endpoint.hpp"

namespace oauthweb {
namespace demo {

// Toy engine: one client ("demo"), one fixed code, one fixed token. Not a real authorization server.
class DemoEndpoint : public IEndpoint {
public:
    void Authorize(IWebRequest& request, IWebResponse& response) override {
        const auto& q = request.Query();
        auto client = q.UniqueValue("client_id");
        auto redirect = q.UniqueValue("redirect_uri");
        if (!client || *client != "demo" || !redirect) {
            throw EndpointError(OAuthError::BadRequest);
        }
        auto parsed = boost::urls::parse_uri(*redirect);
        if (!parsed) {
            throw EndpointError(OAuthError::BadRequest);
        }
        // params() encodes on append and keeps any query the client registered
        boost::urls::url location(*parsed);
        location.params().append(boost::urls::param_view("code", kCode));
        if (auto state = q.UniqueValue("state")) {
            location.params().append(boost::urls::param_view("state", *state));
        }
        response.Redirect(std::string(location.buffer()));
    }

    void AccessToken(IWebRequest& request, IWebResponse& response) override {
        const auto& body = request.UrlBody();
        if (body.UniqueValue("grant_type") != std::optional<std::string>("authorization_code") ||
            body.UniqueValue("code") != std::optional<std::string>(kCode)) {
            response.ClientError();
            response.BodyJson("{\"error\":\"invalid_grant\"}");
            return;
        }
        response.Ok();
        response.BodyJson(std::string("{\"access_token\":\"") + kToken +
                          "\",\"token_type\":\"bearer\",\"refresh_token\":\"" + kRefresh + "\",\"expires_in\":3600}");
    }

    void Refresh(IWebRequest& request, IWebResponse& response) override {
        const auto& body = request.UrlBody();
        if (body.UniqueValue("refresh_token") != std::optional<std::string>(kRefresh)) {
            response.ClientError();
            response.BodyJson("{\"error\":\"invalid_grant\"}");
            return;
        }
        response.BodyJson(std::string("{\"access_token\":\"") + kToken + "\",\"token_type\":\"bearer\",\"expires_in\":3600}");
    }

    std::optional<Grant> Resource(IWebRequest& request, IWebResponse& response) override {
        auto auth = request.AuthHeader();
        if (!auth || *auth != std::string("Bearer ") + kToken) {
            response.Unauthorized("Bearer");
            return std::nullopt;
        }
        Grant g;
        g.ownerId = "demo-user";
        g.clientId = "demo";
        g.scope = "default";
        g.until = std::chrono::system_clock::now() + std::chrono::hours(1);
        return g;
    }

private:
    static constexpr const char* kCode = "demo-code";
    static constexpr const char* kToken = "demo-token";
    static constexpr const char* kRefresh = "demo-refresh";
};

} // namespace demo
} // namespace oauthweb
