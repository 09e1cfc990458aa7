//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/errors/ErrorResponse.cpp
// Purpose: ErrorStatusPolicy and generic error responses
//==========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "oauthweb/errors/ErrorResponse.hpp"

namespace oauthweb {

ErrorStatusPolicy& ErrorStatusPolicy::Override(WebError::Kind kind, http::status status) {
    overrides[kind] = status;
    return *this;
}

ErrorStatusPolicy& ErrorStatusPolicy::Reset(WebError::Kind kind) {
    overrides.erase(kind);
    return *this;
}

ErrorStatusPolicy& ErrorStatusPolicy::Override(OAuthError error, http::status status) {
    oauthOverrides[error] = status;
    return *this;
}

ErrorStatusPolicy& ErrorStatusPolicy::Reset(OAuthError error) {
    oauthOverrides.erase(error);
    return *this;
}

http::status ErrorStatusPolicy::StatusFor(WebError::Kind kind) const {
    auto it = overrides.find(kind);
    if (it == overrides.end()) {
        return http::status::internal_server_error;
    }
    return it->second;
}

http::status ErrorStatusPolicy::StatusFor(const WebError& error) const {
    if (auto code = error.GetOAuthError()) {
        auto it = oauthOverrides.find(*code);
        if (it != oauthOverrides.end()) {
            return it->second;
        }
    }
    return StatusFor(error.GetKind());
}

HttpResponse renderError(const WebError& error, const ErrorStatusPolicy& policy, unsigned int version) {
    const http::status status = policy.StatusFor(error);
    LOG_ERROR("Unhandled {} error ({}): {}", kindName(error.GetKind()),
              static_cast<unsigned int>(status), error.what());

    HttpResponse res{status, version};
    res.set(http::field::content_type, "text/plain");
    res.body() = std::string(http::obsolete_reason(status));
    res.prepare_payload();
    return res;
}

} // namespace oauthweb
