//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/errors/WebError.cpp
// Purpose: WebError descriptions and conversions from each failure origin
//==========================================================================================================

#include <cstdio>
#include <string>

#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {

namespace {
    std::string composeMessage(WebError::Kind kind, const std::optional<OAuthError>& oauth, const std::string& detail) {
        std::string msg;
        if (kind == WebError::Kind::Endpoint && oauth.has_value()) {
            msg = std::string("Endpoint, ") + describe(oauth.value());
        } else {
            msg = describe(kind);
        }
        if (!detail.empty()) {
            msg += ": ";
            msg += detail;
        }
        return msg;
    }

    // Printable form of a rejected header value for logs; control bytes are hex-escaped.
    std::string escapeForLog(const std::string& value) {
        std::string out;
        out.reserve(value.size());
        for (unsigned char c : value) {
            if (c < 0x20 || c == 0x7F) {
                char buf[5];
                std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned int>(c));
                out += buf;
            } else {
                out.push_back(static_cast<char>(c));
            }
        }
        return out;
    }
}

const char* describe(OAuthError error) {
    switch (error) {
        case OAuthError::DenySilently: return "Request should be silently denied";
        case OAuthError::PrimitiveError: return "A server primitive failed during the OAuth flow";
        case OAuthError::BadRequest: return "Request was invalid";
    }
    return "Unknown OAuth error";
}

const char* kindName(WebError::Kind kind) {
    switch (kind) {
        case WebError::Kind::Endpoint: return "Endpoint";
        case WebError::Kind::Header: return "Header";
        case WebError::Kind::Encoding: return "Encoding";
        case WebError::Kind::Form: return "Form";
        case WebError::Kind::Query: return "Query";
        case WebError::Kind::Body: return "Body";
        case WebError::Kind::Authorization: return "Authorization";
        case WebError::Kind::Canceled: return "Canceled";
        case WebError::Kind::Mailbox: return "Mailbox";
    }
    return "Unknown";
}

const char* describe(WebError::Kind kind) {
    switch (kind) {
        case WebError::Kind::Endpoint: return "Endpoint";
        case WebError::Kind::Header: return "Couldn't set header, failed to parse header value";
        case WebError::Kind::Encoding: return "Error decoding request";
        case WebError::Kind::Form: return "Request is not a form";
        case WebError::Kind::Query: return "No query present";
        case WebError::Kind::Body: return "No body present";
        case WebError::Kind::Authorization: return "Request has invalid Authorization headers";
        case WebError::Kind::Canceled: return "Operation canceled";
        case WebError::Kind::Mailbox: return "An actor's mailbox was full";
    }
    return "Unknown error";
}

WebError::WebError(Kind kind, std::string detail)
    : WebError(kind, std::nullopt, std::move(detail)) {}

WebError::WebError(Kind kind, std::optional<OAuthError> oauth, std::string detail)
    : std::runtime_error(composeMessage(kind, oauth, detail)),
      kind(kind), oauth(oauth), detail(std::move(detail)) {}

WebError WebError::fromOAuth(OAuthError error) {
    return WebError(Kind::Endpoint, error, std::string());
}

WebError WebError::fromEndpoint(const EndpointError& error) {
    return fromOAuth(error.Code());
}

WebError WebError::fromHeaderValue(const std::string& value) {
    return WebError(Kind::Header, std::string("'") + escapeForLog(value) + "'");
}

WebError WebError::fromMailbox(MailboxError error) {
    switch (error) {
        case MailboxError::Full: return WebError(Kind::Mailbox, "mailbox full");
        case MailboxError::Closed: return WebError(Kind::Mailbox, "mailbox closed");
        case MailboxError::Timeout: return WebError(Kind::Canceled, "reply timed out");
    }
    return WebError(Kind::Mailbox);
}

WebError WebError::fromFutureError(const std::future_error& error) {
    if (error.code() == std::future_errc::broken_promise) {
        return WebError(Kind::Canceled, "reply dropped before completion");
    }
    return WebError(Kind::Canceled, error.what());
}

bool WebError::isTransient() const noexcept {
    return kind == Kind::Canceled || kind == Kind::Mailbox;
}

} // namespace oauthweb
