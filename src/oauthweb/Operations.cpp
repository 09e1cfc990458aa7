//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/Operations.cpp
// Purpose: Operation runs against the endpoint engine
//==========================================================================================================

#include "logging/Logger.h"
#include "oauthweb/Operations.hpp"

namespace oauthweb {

namespace {
    // Runs one engine flow, translating protocol failures into WebError.
    template <typename Fn>
    auto runFlow(const char* name, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const EndpointError& e) {
            LOG_DEBUG("{} flow failed in endpoint: {}", name, e.what());
            throw WebError::fromEndpoint(e);
        }
    }
}

Authorize::Item Authorize::Run(IEndpoint& endpoint) && {
    OAuthRequest req = std::move(request);
    return runFlow("authorize", [&]() {
        OAuthResponse res;
        endpoint.Authorize(req, res);
        return res;
    });
}

Token::Item Token::Run(IEndpoint& endpoint) && {
    OAuthRequest req = std::move(request);
    return runFlow("token", [&]() {
        OAuthResponse res;
        endpoint.AccessToken(req, res);
        return res;
    });
}

Refresh::Item Refresh::Run(IEndpoint& endpoint) && {
    OAuthRequest req = std::move(request);
    return runFlow("refresh", [&]() {
        OAuthResponse res;
        endpoint.Refresh(req, res);
        return res;
    });
}

Resource::Item Resource::Run(IEndpoint& endpoint) && {
    OAuthRequest req = std::move(request);
    return runFlow("resource", [&]() -> ResourceOutcome {
        OAuthResponse res;
        std::optional<Grant> grant = endpoint.Resource(req, res);
        if (grant.has_value()) {
            return std::move(grant.value());
        }
        return res;
    });
}

} // namespace oauthweb
