//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebError.hpp
// Purpose: Unified error type for request extraction, response construction, dispatch and protocol failures
//==========================================================================================================

#pragma once

#include <future>
#include <optional>
#include <string>
#include <stdexcept>

#include "oauthweb/errors/OAuthError.hpp"

namespace oauthweb {

// Failure signalled by a worker mailbox.
enum class MailboxError {
    Full,    // Mailbox at capacity
    Closed,  // Worker stopped or never started
    Timeout  // Reply did not arrive in time
};

//==========================================================================================================
// WebError
// Purpose: Single error type raised by every part of the adapter. The kind set is closed; conversions
//          into WebError exist for each failure origin, none lead back out.
// Notes:
//   - what() returns the human-readable description, suitable for operator logs only.
//   - Canceled and Mailbox are transient; all other kinds are permanent for the given request.
//==========================================================================================================
class WebError : public std::runtime_error {
public:
    enum class Kind {
        Endpoint,       // Protocol error raised by the engine
        Header,         // Outgoing header value could not be constructed
        Encoding,       // Request data was not valid in its declared encoding
        Form,           // Request body could not be parsed as a form
        Query,          // Request query was absent or could not be parsed
        Body,           // Request body was absent or could not be parsed
        Authorization,  // Request carried more than one Authorization header
        Canceled,       // Background processing was canceled or timed out
        Mailbox         // Worker mailbox was full or closed
    };

    explicit WebError(Kind kind, std::string detail = std::string());

    ////////////////////////////////////////// Conversions //////////////////////////////////////////
    static WebError fromOAuth(OAuthError error);
    static WebError fromEndpoint(const EndpointError& error);
    static WebError fromHeaderValue(const std::string& value);
    static WebError fromMailbox(MailboxError error);
    static WebError fromFutureError(const std::future_error& error);

    Kind GetKind() const noexcept { return kind; }
    const std::optional<OAuthError>& GetOAuthError() const noexcept { return oauth; }
    const std::string& Detail() const noexcept { return detail; }

    // True for failures a caller may retry (Canceled, Mailbox).
    bool isTransient() const noexcept;

private:
    WebError(Kind kind, std::optional<OAuthError> oauth, std::string detail);

    Kind kind;
    std::optional<OAuthError> oauth;
    std::string detail;
};

// Short stable name of a kind, e.g. "Authorization".
const char* kindName(WebError::Kind kind);

// Description of a kind without detail, e.g. "No query present".
const char* describe(WebError::Kind kind);

} // namespace oauthweb
