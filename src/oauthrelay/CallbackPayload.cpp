//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CallbackPayload.cpp
// Purpose: Callback payload container and query/form/JSON decoders
//==========================================================================================================

#include <memory>

#include "oauthrelay/CallbackPayload.h"

namespace oauthrelay {

CallbackPayload::CallbackPayload(std::vector<Entry> entries) {
    for (auto& [key, val] : entries) {
        Set(key, std::move(val));
    }
}

void CallbackPayload::Set(const std::string& key, JSONValue value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

const JSONValue* CallbackPayload::Find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::optional<std::string> CallbackPayload::GetString(const std::string& key) const {
    const JSONValue* v = Find(key);
    if (v == nullptr || !v->isString()) {
        return std::nullopt;
    }
    return std::get<std::string>(v->value);
}

JSONValue CallbackPayload::ToJSON() const {
    JSONValue::Object obj;
    for (const auto& [key, val] : entries_) {
        obj[key] = std::make_shared<JSONValue>(val);
    }
    return JSONValue(std::move(obj));
}

std::string PercentDecode(std::string_view text) {
    auto hexValue = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
        return -1;
    };
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < text.size()) {
            int hi = hexValue(text[i + 1]);
            int lo = hexValue(text[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

CallbackPayload PayloadFromQueryString(std::string_view query) {
    CallbackPayload payload;
    if (!query.empty() && query.front() == '?') {
        query.remove_prefix(1);
    }
    std::size_t start = 0;
    while (start <= query.size()) {
        std::size_t amp = query.find('&', start);
        std::string_view pair = (amp == std::string_view::npos) ? query.substr(start) : query.substr(start, amp - start);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            std::string key = PercentDecode(pair.substr(0, eq));
            std::string val = (eq == std::string_view::npos) ? std::string() : PercentDecode(pair.substr(eq + 1));
            if (!key.empty()) {
                payload.Set(key, JSONValue(std::move(val)));
            }
        }
        if (amp == std::string_view::npos) {
            break;
        }
        start = amp + 1;
    }
    return payload;
}

CallbackPayload PayloadFromJSONBody(const std::string& body) {
    return CallbackPayload(ParseJSONObjectMembers(body));
}

} // namespace oauthrelay
