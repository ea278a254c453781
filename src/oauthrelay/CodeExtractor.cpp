//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CodeExtractor.cpp
// Purpose: Case-insensitive authorization code extraction
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <fmt/format.h>

#include "oauthrelay/CodeExtractor.h"

namespace oauthrelay {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

bool IsFalsy(const JSONValue& value) {
    return std::visit([](const auto& v) -> bool {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return true;
        } else if constexpr (std::is_same_v<T, bool>) {
            return !v;
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return v == 0;
        } else if constexpr (std::is_same_v<T, double>) {
            return v == 0.0;
        } else {
            return v.empty();
        }
    }, value.get());
}

std::string CoerceToString(const JSONValue& value) {
    return std::visit([&value](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "None";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "True" : "False";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            // Shortest round-trip digits; integral values keep a ".0" suffix.
            std::string text = fmt::format("{}", v);
            if (text.find_first_of(".eEin") == std::string::npos) {
                text += ".0";
            }
            return text;
        } else {
            return SerializeJSON(value);
        }
    }, value.get());
}

std::optional<std::string> ExtractCode(const CallbackPayload& payload,
                                       const std::vector<std::string>& candidateKeys) {
    std::unordered_map<std::string, const JSONValue*> lowered;
    for (const auto& [key, val] : payload.Entries()) {
        lowered[toLower(key)] = &val;
    }

    for (const auto& candidate : candidateKeys) {
        auto it = lowered.find(toLower(candidate));
        if (it == lowered.end()) {
            continue;
        }
        const JSONValue& value = *it->second;
        if (value.isArray()) {
            const auto& arr = std::get<JSONValue::Array>(value.value);
            if (!arr.empty()) {
                return arr.front() ? CoerceToString(*arr.front()) : std::string("None");
            }
            return std::nullopt;
        }
        if (IsFalsy(value)) {
            return std::nullopt;
        }
        return CoerceToString(value);
    }
    return std::nullopt;
}

} // namespace oauthrelay
