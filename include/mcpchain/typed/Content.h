//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting typed content (text, numbers) from tool results
//==========================================================================================================

#pragma once

#include <charconv>
#include <cmath>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "mcpchain/Protocol.h"
#include "mcpchain/JsonAccess.h"

namespace mcpchain {
namespace typed {

//------------------------------ Number text ------------------------------
// Shortest decimal rendering that round-trips ("2", "0.1", "2.5e-07"); "NaN"/"inf" for non-finite values.
inline std::string formatNumber(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) return std::to_string(v);
    return std::string(buf, ptr);
}

// Strict parse: the whole text (after trimming ASCII whitespace) must be one decimal number.
inline std::optional<double> parseNumber(const std::string& text) {
    std::size_t b = text.find_first_not_of(" \t\r\n");
    std::size_t e = text.find_last_not_of(" \t\r\n");
    if (b == std::string::npos) return std::nullopt;
    const char* first = text.data() + b;
    const char* last = text.data() + e + 1;
    if (*first == '+') ++first;
    double d = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, d);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return d;
}

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

inline CallToolResult textResult(const std::string& text) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    return r;
}

// Domain failure reported in-band (isError: true), not as a JSON-RPC error.
inline CallToolResult errorResult(const std::string& text) {
    CallToolResult r;
    r.content.push_back(makeText(text));
    r.isError = true;
    return r;
}

// Numeric result: text content plus structuredContent { value }.
inline CallToolResult numberResult(double value) {
    CallToolResult r;
    r.content.push_back(makeText(formatNumber(value)));
    JSONValue::Object sc;
    sc["value"] = std::make_shared<JSONValue>(value);
    r.structuredContent = JSONValue{std::move(sc)};
    return r;
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    auto type = json::getString(v, "type");
    return type.has_value() && type.value() == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    return json::getString(v, "text");
}

inline std::optional<std::string> firstText(const CallToolResult& r) {
    for (const auto& v : r.content) {
        auto t = getText(v);
        if (t.has_value()) return t;
    }
    return std::nullopt;
}

//==========================================================================================================
// numberValue
// Purpose: Decodes a single numeric result: structuredContent.value first, then the first text item.
// Returns:
//   std::nullopt when neither carries a number.
//==========================================================================================================
inline std::optional<double> numberValue(const CallToolResult& r) {
    if (r.structuredContent.has_value()) {
        auto v = json::getNumber(r.structuredContent.value(), "value");
        if (v.has_value()) return v;
    }
    auto t = firstText(r);
    if (!t.has_value()) return std::nullopt;
    return parseNumber(t.value());
}

} // namespace typed
} // namespace mcpchain
