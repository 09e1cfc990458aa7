//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/NormalizedParameter.cpp
// Purpose: NormalizedParameter implementation
//==========================================================================================================

#include "oauthweb/NormalizedParameter.hpp"

namespace oauthweb {

void NormalizedParameter::Insert(std::string key, std::string value) {
    entries.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> NormalizedParameter::UniqueValue(const std::string& key) const {
    std::optional<std::string> found;
    for (const auto& e : entries) {
        if (e.first != key) {
            continue;
        }
        if (found.has_value()) {
            return std::nullopt;
        }
        found = e.second;
    }
    return found;
}

std::vector<std::string> NormalizedParameter::Values(const std::string& key) const {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        if (e.first == key) {
            out.push_back(e.second);
        }
    }
    return out;
}

bool NormalizedParameter::Contains(const std::string& key) const {
    for (const auto& e : entries) {
        if (e.first == key) {
            return true;
        }
    }
    return false;
}

} // namespace oauthweb
