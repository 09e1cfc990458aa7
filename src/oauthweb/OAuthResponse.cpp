//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/OAuthResponse.cpp
// Purpose: OAuthResponse actions and finalization
//==========================================================================================================

#include "oauthweb/HeaderValue.hpp"
#include "oauthweb/OAuthResponse.hpp"

namespace oauthweb {

OAuthResponse& OAuthResponse::WithContentType(const std::string& contentType) {
    headers.set(http::field::content_type, makeHeaderValue(contentType));
    return *this;
}

OAuthResponse& OAuthResponse::WithBody(const std::string& text) {
    body = text;
    return *this;
}

void OAuthResponse::Ok() {
    status = http::status::ok;
}

void OAuthResponse::Redirect(const std::string& url) {
    std::string location = makeHeaderValue(url);
    status = http::status::found;
    headers.set(http::field::location, location);
}

void OAuthResponse::ClientError() {
    status = http::status::bad_request;
}

void OAuthResponse::Unauthorized(const std::string& kind) {
    std::string challenge = makeHeaderValue(kind);
    status = http::status::unauthorized;
    headers.set(http::field::www_authenticate, challenge);
}

void OAuthResponse::BodyText(const std::string& text) {
    body = text;
    headers.set(http::field::content_type, "text/plain");
}

void OAuthResponse::BodyJson(const std::string& json) {
    body = json;
    headers.set(http::field::content_type, "application/json");
}

HttpResponse OAuthResponse::ToHttp(unsigned int version) const {
    HttpResponse res{status, version};
    for (const auto& field : headers) {
        res.insert(field.name_string(), field.value());
    }
    if (body.has_value()) {
        res.body() = body.value();
    }
    res.prepare_payload();
    return res;
}

} // namespace oauthweb
