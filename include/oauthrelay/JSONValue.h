//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON value model, parser and serializer used by the relay wire protocol
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <utility>
#include <variant>
#include <unordered_map>
#include <vector>

namespace oauthrelay {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
};

// Deep structural equality. Object member order is irrelevant; int64 and double never compare equal.
bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

// Ordered member list of a JSON object, as it appeared in the source text.
using JSONMembers = std::vector<std::pair<std::string, JSONValue>>;

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value (no whitespace, strings escaped, non-finite doubles as null).
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// ParseJSON
// Purpose: Parse a complete JSON document.
// Args:
//   text: JSON text; surrounding whitespace is allowed, trailing content is not.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// ParseJSONObjectMembers
// Purpose: Parse a JSON document whose top level must be an object, keeping member order.
//          Duplicate keys are kept in source order.
// Throws:
//   std::runtime_error on syntax errors or when the top level is not an object.
//==========================================================================================================
JSONMembers ParseJSONObjectMembers(const std::string& text);

} // namespace oauthrelay
