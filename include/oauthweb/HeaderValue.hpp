//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HeaderValue.hpp
// Purpose: Validation of HTTP header field values before they are placed on a response
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>

namespace oauthweb {

//==========================================================================================================
// isValidHeaderValue
// Purpose: True when text may be sent as a header field value: visible ASCII, SP, HTAB and obs-text
//          (0x80-0xFF). CR, LF, NUL, DEL and other control bytes are rejected.
//==========================================================================================================
bool isValidHeaderValue(std::string_view text);

// True when text consists only of visible ASCII, SP and HTAB.
bool isVisibleAscii(std::string_view text);

//==========================================================================================================
// makeHeaderValue
// Purpose: Returns text as an owned header value.
// Throws:
//   WebError (Kind::Header) when isValidHeaderValue(text) is false.
//==========================================================================================================
std::string makeHeaderValue(std::string_view text);

} // namespace oauthweb
