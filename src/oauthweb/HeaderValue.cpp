//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/HeaderValue.cpp
// Purpose: Header value validation
//==========================================================================================================

#include "oauthweb/HeaderValue.hpp"
#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {

bool isValidHeaderValue(std::string_view text) {
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '\t') {
            continue;
        }
        if (c < 0x20 || c == 0x7F) {
            return false;
        }
    }
    return true;
}

bool isVisibleAscii(std::string_view text) {
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (c == '\t') {
            continue;
        }
        if (c < 0x20 || c >= 0x7F) {
            return false;
        }
    }
    return true;
}

std::string makeHeaderValue(std::string_view text) {
    if (!isValidHeaderValue(text)) {
        throw WebError::fromHeaderValue(std::string(text));
    }
    return std::string(text);
}

} // namespace oauthweb
