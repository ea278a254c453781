//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Relay wire message encoding and decoding
//==========================================================================================================

#include <sstream>
#include <stdexcept>

#include "oauthrelay/Protocol.h"
#include "oauthrelay/errors/Errors.h"
#include "logging/Logger.h"

namespace oauthrelay {

namespace {

void writeStringField(std::ostringstream& oss, const char* name, const std::optional<std::string>& v) {
    if (!v.has_value()) {
        return;
    }
    oss << ",\"" << name << "\":" << SerializeJSON(JSONValue(v.value()));
}

std::optional<std::string> readStringField(const std::string& name, const JSONValue& v) {
    if (v.isNull()) {
        return std::nullopt;
    }
    if (!v.isString()) {
        throw errors::ProtocolError("Field '" + name + "' must be a string");
    }
    return std::get<std::string>(v.value);
}

} // namespace

const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::Register: return "REGISTER";
        case MessageType::Deliver: return "DELIVER";
        case MessageType::Error: return "ERROR";
        case MessageType::Unregister: return "UNREGISTER";
    }
    return "UNKNOWN";
}

std::optional<MessageType> MessageTypeFromString(const std::string& name) {
    if (name == "REGISTER") return MessageType::Register;
    if (name == "DELIVER") return MessageType::Deliver;
    if (name == "ERROR") return MessageType::Error;
    if (name == "UNREGISTER") return MessageType::Unregister;
    return std::nullopt;
}

namespace {
bool hasRaw(const SocketMessage& m) {
    return m.raw.has_value() && !m.raw->isNull();
}
} // namespace

bool operator==(const SocketMessage& a, const SocketMessage& b) {
    if (hasRaw(a) != hasRaw(b) || (hasRaw(a) && !(*a.raw == *b.raw))) {
        return false;
    }
    return a.type == b.type && a.state == b.state && a.code == b.code && a.error == b.error;
}

std::string EncodeMessage(const SocketMessage& message) {
    FUNC_SCOPE();
    std::ostringstream oss;
    oss << "{\"type\":\"" << MessageTypeToString(message.type) << "\"";
    writeStringField(oss, "state", message.state);
    writeStringField(oss, "code", message.code);
    if (hasRaw(message)) {
        oss << ",\"raw\":" << SerializeJSON(message.raw.value());
    }
    writeStringField(oss, "error", message.error);
    oss << "}\n";
    return oss.str();
}

SocketMessage DecodeMessage(const std::string& line) {
    FUNC_SCOPE();
    std::string text = line;
    if (!text.empty() && text.back() == '\n') text.pop_back();
    if (!text.empty() && text.back() == '\r') text.pop_back();

    JSONMembers members;
    try {
        members = ParseJSONObjectMembers(text);
    } catch (const std::runtime_error& e) {
        throw errors::ProtocolError(std::string("Malformed relay message: ") + e.what());
    }

    SocketMessage msg;
    bool sawType = false;
    for (const auto& [key, val] : members) {
        if (key == "type") {
            if (!val.isString()) {
                throw errors::ProtocolError("Field 'type' must be a string");
            }
            const auto& name = std::get<std::string>(val.value);
            auto type = MessageTypeFromString(name);
            if (!type.has_value()) {
                throw errors::ProtocolError("Unknown message type: " + name);
            }
            msg.type = type.value();
            sawType = true;
        } else if (key == "state") {
            msg.state = readStringField(key, val);
        } else if (key == "code") {
            msg.code = readStringField(key, val);
        } else if (key == "error") {
            msg.error = readStringField(key, val);
        } else if (key == "raw") {
            if (val.isNull()) {
                msg.raw.reset();
            } else {
                msg.raw = val;
            }
        } else {
            throw errors::ProtocolError("Unknown field: " + key);
        }
    }
    if (!sawType) {
        throw errors::ProtocolError("Missing field 'type'");
    }
    return msg;
}

} // namespace oauthrelay
