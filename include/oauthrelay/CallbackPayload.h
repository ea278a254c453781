//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallbackPayload.h
// Purpose: Ordered key/value payload received from an authorization provider redirect, plus decoders
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "oauthrelay/JSONValue.h"

namespace oauthrelay {

//==========================================================================================================
// CallbackPayload
// Purpose: Insertion-ordered mapping from parameter name to JSONValue. Values are strings for query and
//          form payloads and arbitrary JSON for JSON bodies.
// Notes:
//   Set() replaces the value of an existing key in place (keeping its position) and appends new keys.
//==========================================================================================================
class CallbackPayload {
public:
    using Entry = std::pair<std::string, JSONValue>;

    CallbackPayload() = default;
    explicit CallbackPayload(std::vector<Entry> entries);

    void Set(const std::string& key, JSONValue value);

    // Exact (case-sensitive) lookup; nullptr when absent.
    const JSONValue* Find(const std::string& key) const;

    // Exact lookup of a string-valued key. Non-string, null or missing values yield std::nullopt.
    std::optional<std::string> GetString(const std::string& key) const;

    const std::vector<Entry>& Entries() const { return entries_; }
    bool Empty() const { return entries_.empty(); }
    std::size_t Size() const { return entries_.size(); }

    // Payload as a JSON object (used as the raw fallback on the wire).
    JSONValue ToJSON() const;

private:
    std::vector<Entry> entries_;
};

//==========================================================================================================
// PercentDecode
// Purpose: Decode application/x-www-form-urlencoded text ('+' to space, %XX escapes).
//          Malformed escapes are kept literally.
//==========================================================================================================
std::string PercentDecode(std::string_view text);

//==========================================================================================================
// PayloadFromQueryString
// Purpose: Decode "a=1&b=2" (a leading '?' is skipped). Keys without '=' get an empty value; empty keys
//          are dropped; repeated keys keep the last value.
//==========================================================================================================
CallbackPayload PayloadFromQueryString(std::string_view query);

//==========================================================================================================
// PayloadFromJSONBody
// Purpose: Decode a JSON object body, keeping member order.
// Throws:
//   std::runtime_error when the body is not valid JSON or not an object.
//==========================================================================================================
CallbackPayload PayloadFromJSONBody(const std::string& body);

} // namespace oauthrelay
