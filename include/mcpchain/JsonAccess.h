//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonAccess.h
// Purpose: Small lookup/build helpers over JSONValue objects shared by handlers and transports
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {
namespace json {

// Returns the member value or nullptr when v is not an object, the key is absent, or the slot is empty.
inline const JSONValue* member(const JSONValue& v, const std::string& key) {
    if (!std::holds_alternative<JSONValue::Object>(v.value)) return nullptr;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline std::optional<std::string> getString(const JSONValue& v, const std::string& key) {
    const JSONValue* m = member(v, key);
    if (!m || !std::holds_alternative<std::string>(m->value)) return std::nullopt;
    return std::get<std::string>(m->value);
}

inline std::optional<bool> getBool(const JSONValue& v, const std::string& key) {
    const JSONValue* m = member(v, key);
    if (!m || !std::holds_alternative<bool>(m->value)) return std::nullopt;
    return std::get<bool>(m->value);
}

// Numeric view of a value (int64_t or double).
inline std::optional<double> asNumber(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
    if (std::holds_alternative<double>(v.value)) return std::get<double>(v.value);
    return std::nullopt;
}

inline std::optional<double> getNumber(const JSONValue& v, const std::string& key) {
    const JSONValue* m = member(v, key);
    if (!m) return std::nullopt;
    return asNumber(*m);
}

// Array of numbers; std::nullopt when the member is missing, not an array, or holds a non-number.
inline std::optional<std::vector<double>> getNumberArray(const JSONValue& v, const std::string& key) {
    const JSONValue* m = member(v, key);
    if (!m || !m->isArray()) return std::nullopt;
    std::vector<double> out;
    for (const auto& item : std::get<JSONValue::Array>(m->value)) {
        if (!item) return std::nullopt;
        auto n = asNumber(*item);
        if (!n.has_value()) return std::nullopt;
        out.push_back(n.value());
    }
    return out;
}

//------------------------------ Required arguments ------------------------------
// Tool arguments are schema-checked before dispatch; these throw std::invalid_argument if that was bypassed.
inline double requireNumber(const JSONValue& args, const std::string& key) {
    auto v = getNumber(args, key);
    if (!v.has_value()) throw std::invalid_argument("missing number argument '" + key + "'");
    return v.value();
}

inline std::string requireString(const JSONValue& args, const std::string& key) {
    auto v = getString(args, key);
    if (!v.has_value()) throw std::invalid_argument("missing string argument '" + key + "'");
    return v.value();
}

inline std::vector<double> requireNumberArray(const JSONValue& args, const std::string& key) {
    auto v = getNumberArray(args, key);
    if (!v.has_value()) throw std::invalid_argument("missing number array argument '" + key + "'");
    return v.value();
}

inline void set(JSONValue::Object& o, const std::string& key, JSONValue v) {
    o[key] = std::make_shared<JSONValue>(std::move(v));
}

inline JSONValue numberArray(const std::vector<double>& values) {
    JSONValue::Array arr;
    arr.reserve(values.size());
    for (double d : values) arr.push_back(std::make_shared<JSONValue>(d));
    return JSONValue{std::move(arr)};
}

} // namespace json
} // namespace mcpchain
