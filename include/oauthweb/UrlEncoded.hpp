//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: UrlEncoded.hpp
// Purpose: application/x-www-form-urlencoded parsing of request targets and form bodies
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "oauthweb/HttpTypes.hpp"
#include "oauthweb/NormalizedParameter.hpp"

namespace oauthweb {

// Default upper bound for form bodies.
inline constexpr std::size_t kDefaultFormLimit = 16 * 1024;

// Form body limit: OAUTHWEB_FORM_LIMIT when set, else kDefaultFormLimit.
std::size_t formLimitFromEnv();

enum class ParseStatus {
    Ok,
    NotForm,          // Content-Type is not application/x-www-form-urlencoded
    TooLarge,         // Body exceeds the configured limit
    InvalidEncoding,  // Unsupported charset
    InvalidTarget     // Request target is not a URI reference even after escaping stray bytes
};

const char* describe(ParseStatus status);

//==========================================================================================================
// ParseResult
// Purpose: Outcome of a parse; params is present exactly when status == Ok.
//==========================================================================================================
struct ParseResult {
    ParseStatus status{ParseStatus::Ok};
    std::optional<NormalizedParameter> params;
};

//==========================================================================================================
// parseUrlEncoded
// Purpose: Decode "k=v&k2=v2". '+' decodes to space, %XX to the byte. Empty segments are skipped and a
//          segment without '=' yields an empty value. Decoding is lenient: a '%' that does not start an
//          escape is kept literally and invalid UTF-8 is replaced with U+FFFD.
//==========================================================================================================
ParseResult parseUrlEncoded(std::string_view text);

//==========================================================================================================
// parseQuery
// Purpose: Parse the query component of the request target. A target without '?' yields an empty,
//          present parameter set. Only a target that is not a URI reference at all yields no parameters.
//==========================================================================================================
ParseResult parseQuery(const HttpRequest& request);

//==========================================================================================================
// parseForm
// Purpose: Parse the request body as a urlencoded form.
// Args:
//   request: Request whose body has already been read by the framework.
//   limit: Maximum body size in bytes.
//==========================================================================================================
ParseResult parseForm(const HttpRequest& request, std::size_t limit = formLimitFromEnv());

//==========================================================================================================
// expectParsed
// Purpose: Unwrap a parse result for callers that need the parameters immediately.
// Throws:
//   WebError Form for NotForm/TooLarge, Encoding for InvalidEncoding/InvalidTarget.
//==========================================================================================================
NormalizedParameter expectParsed(ParseResult result);

} // namespace oauthweb
