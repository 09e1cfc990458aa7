//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NormalizedParameter.hpp
// Purpose: Ordered key/value(s) parameter set abstracting query-string and form-body encodings
//==========================================================================================================

#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace oauthweb {

//==========================================================================================================
// NormalizedParameter
// Purpose: Ordered multimap of decoded parameters. Insertion order is preserved and repeated keys are kept.
// Notes:
//   - UniqueValue() refuses to pick among repeated keys; protocol parameters that occur more than once
//     are treated as absent.
//==========================================================================================================
class NormalizedParameter {
public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    NormalizedParameter() = default;
    NormalizedParameter(std::initializer_list<Entry> entries) : entries(entries) {}

    void Insert(std::string key, std::string value);

    //==========================================================================================================
    // UniqueValue
    // Returns:
    //   The value when key occurs exactly once; std::nullopt when absent or repeated.
    //==========================================================================================================
    std::optional<std::string> UniqueValue(const std::string& key) const;

    // All values for key in insertion order.
    std::vector<std::string> Values(const std::string& key) const;

    bool Contains(const std::string& key) const;
    std::size_t Size() const { return entries.size(); }
    bool Empty() const { return entries.empty(); }

    const_iterator begin() const { return entries.begin(); }
    const_iterator end() const { return entries.end(); }

    bool operator==(const NormalizedParameter& other) const = default;

private:
    std::vector<Entry> entries;
};

} // namespace oauthweb
