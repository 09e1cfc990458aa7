//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/OAuthRequest.cpp
// Purpose: OAuthRequest / OAuthResource extraction from Boost.Beast requests
//==========================================================================================================

#include <string>

#include "logging/Logger.h"
#include "oauthweb/HeaderValue.hpp"
#include "oauthweb/OAuthRequest.hpp"

namespace oauthweb {

namespace {
    // One-or-none Authorization header rule shared by both adapters.
    std::optional<std::string> extractAuthorization(const HttpRequest& request) {
        auto range = request.equal_range(http::field::authorization);
        auto it = range.first;
        if (it == range.second) {
            return std::nullopt;
        }
        auto next = it;
        ++next;
        if (next != range.second) {
            LOG_WARN("Rejecting request to {} with multiple Authorization headers",
                     std::string(request.target()));
            throw WebError(WebError::Kind::Authorization);
        }
        const std::string value(it->value());
        if (!isVisibleAscii(value)) {
            LOG_DEBUG("Ignoring Authorization header with non-visible characters");
            return std::nullopt;
        }
        return value;
    }
}

OAuthRequest::OAuthRequest(std::optional<std::string> auth,
                           std::optional<NormalizedParameter> query,
                           std::optional<NormalizedParameter> body)
    : auth(std::move(auth)), query(std::move(query)), body(std::move(body)) {}

OAuthRequest OAuthRequest::FromHttp(const HttpRequest& request, std::size_t formLimit) {
    auto auth = extractAuthorization(request);

    ParseResult q = parseQuery(request);
    ParseResult b = parseForm(request, formLimit);
    if (q.status != ParseStatus::Ok) {
        LOG_DEBUG("Query of {} left absent: {}", std::string(request.target()), describe(q.status));
    }
    if (b.status != ParseStatus::Ok) {
        LOG_DEBUG("Body of {} left absent: {}", std::string(request.target()), describe(b.status));
    }

    OAuthRequest out(std::move(auth), std::move(q.params), std::move(b.params));
    out.queryStatus = q.status;
    out.bodyStatus = b.status;
    return out;
}

const NormalizedParameter& OAuthRequest::Query() {
    if (!query.has_value()) {
        throw WebError(WebError::Kind::Query,
                       queryStatus == ParseStatus::Ok ? std::string() : std::string(describe(queryStatus)));
    }
    return query.value();
}

const NormalizedParameter& OAuthRequest::UrlBody() {
    if (!body.has_value()) {
        throw WebError(WebError::Kind::Body,
                       bodyStatus == ParseStatus::Ok ? std::string() : std::string(describe(bodyStatus)));
    }
    return body.value();
}

std::optional<std::string> OAuthRequest::AuthHeader() {
    return auth;
}

OAuthResource OAuthResource::FromHttp(const HttpRequest& request) {
    return OAuthResource(extractAuthorization(request));
}

OAuthRequest OAuthResource::IntoRequest() && {
    return OAuthRequest(std::move(auth), std::nullopt, std::nullopt);
}

} // namespace oauthweb
