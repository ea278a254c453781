//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CodeExtractor.h
// Purpose: Extracts an authorization code from a callback payload by case-insensitive key match
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "oauthrelay/CallbackPayload.h"
#include "oauthrelay/JSONValue.h"

namespace oauthrelay {

//==========================================================================================================
// ExtractCode
// Purpose: Find the authorization code in a provider callback payload.
// Args:
//   payload: Callback parameters. Keys are compared lower-cased; when two keys collide after
//            lower-casing, the later one wins.
//   candidateKeys: Keys to try, in priority order.
// Returns:
//   - The first element (coerced to string) when the first matching key holds a non-empty array.
//   - The value coerced to string when it holds a truthy scalar.
//   - std::nullopt when the first matching key holds an empty/falsy value, or nothing matches.
// Notes:
//   Scanning stops at the first candidate whose key is present, even if its value is unusable.
//==========================================================================================================
std::optional<std::string> ExtractCode(const CallbackPayload& payload,
                                       const std::vector<std::string>& candidateKeys);

// True for null, false, 0, 0.0, "", [] and {}.
bool IsFalsy(const JSONValue& value);

// Text form of a value as the provider-facing tools print it: strings verbatim, null as "None", booleans as
// "True"/"False", integers in decimal, doubles in shortest round-trip form ("0.1", "2.0"). Arrays and
// objects become compact JSON.
std::string CoerceToString(const JSONValue& value);

} // namespace oauthrelay
