//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Relay wire protocol: message types, line-delimited JSON codec and client-facing result
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "oauthrelay/JSONValue.h"

namespace oauthrelay {

//==========================================================================================================
// MessageType
// Purpose: Tag of a relay wire message. Serialized as the upper-case names below.
//==========================================================================================================
enum class MessageType {
    Register,   // "REGISTER"   client -> coordinator, parks a waiter for `state`
    Deliver,    // "DELIVER"    coordinator -> client, carries `code` and/or `raw`
    Error,      // "ERROR"
    Unregister  // "UNREGISTER"
};

// Wire name of a MessageType ("REGISTER", "DELIVER", ...).
const char* MessageTypeToString(MessageType type);

// Parses a wire name; std::nullopt for unknown tags. Case-sensitive.
std::optional<MessageType> MessageTypeFromString(const std::string& name);

//==========================================================================================================
// SocketMessage
// Purpose: One record exchanged between a waiting client and the coordinator.
// Fields:
//   type: Message tag (required on the wire).
//   state: Correlation token (REGISTER, echoed on DELIVER).
//   code: Extracted authorization code (DELIVER).
//   raw: Full callback payload when no code could be extracted (DELIVER).
//   error: Error description (ERROR).
// Notes:
//   Absent fields are omitted on the wire rather than written as null. A `raw` holding JSON null counts
//   as absent, both when encoding and when comparing.
//==========================================================================================================
struct SocketMessage {
    MessageType type{MessageType::Register};
    std::optional<std::string> state;
    std::optional<std::string> code;
    std::optional<JSONValue> raw;
    std::optional<std::string> error;
};

bool operator==(const SocketMessage& a, const SocketMessage& b);
inline bool operator!=(const SocketMessage& a, const SocketMessage& b) { return !(a == b); }

//==========================================================================================================
// EncodeMessage
// Purpose: Serialize a message as a single JSON object followed by '\n'.
// Returns:
//   The encoded record, always terminated by exactly one newline.
//==========================================================================================================
std::string EncodeMessage(const SocketMessage& message);

//==========================================================================================================
// DecodeMessage
// Purpose: Parse one record produced by EncodeMessage. A single trailing "\n" or "\r\n" is ignored.
// Args:
//   line: Record text.
// Returns:
//   The decoded message.
// Throws:
//   errors::ProtocolError when the text is not a JSON object, `type` is missing or unknown,
//   a field has the wrong JSON type, or an unknown field is present.
//==========================================================================================================
SocketMessage DecodeMessage(const std::string& line);

//==========================================================================================================
// DeliveryResult
// Purpose: What a waiting client receives: the extracted code, or the raw payload when extraction failed.
//==========================================================================================================
struct DeliveryResult {
    std::optional<std::string> code;
    std::optional<JSONValue> raw;

    // True when a code was delivered.
    bool Success() const { return code.has_value(); }
};

} // namespace oauthrelay
