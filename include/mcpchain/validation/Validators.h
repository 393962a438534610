//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for tool arguments (JSON Schema subset) and tool result shapes
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "mcpchain/Protocol.h"
#include "mcpchain/JsonAccess.h"

namespace mcpchain {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
inline bool isTextContentItem(const JSONValue& v) {
    auto type = json::getString(v, "type");
    if (!type.has_value() || type.value() != "text") return false;
    return json::getString(v, "text").has_value();
}

//------------------------------ JSON validators ------------------------------
// CallToolResult: { content: [ {type:"text", text} | other typed items ... ], isError?: bool }
inline bool validateCallToolResultJson(const JSONValue& v) {
    const JSONValue* content = json::member(v, "content");
    if (!content || !content->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p || !p->isObject()) return false;
        auto type = json::getString(*p, "type");
        if (!type.has_value()) return false;
        if (type.value() == "text" && !isTextContentItem(*p)) return false;
    }
    const JSONValue* isError = json::member(v, "isError");
    if (isError && !std::holds_alternative<bool>(isError->value)) return false;
    return true;
}

// tools/list result: { tools: [ { name: string, inputSchema: object, ... } ], nextCursor?: string }
inline bool validateToolsListResultJson(const JSONValue& v) {
    const JSONValue* tools = json::member(v, "tools");
    if (!tools || !tools->isArray()) return false;
    for (const auto& t : std::get<JSONValue::Array>(tools->value)) {
        if (!t || !json::getString(*t, "name").has_value()) return false;
        const JSONValue* schema = json::member(*t, "inputSchema");
        if (!schema || !schema->isObject()) return false;
    }
    const JSONValue* cursor = json::member(v, "nextCursor");
    if (cursor && !cursor->isString() && !cursor->isNull()) return false;
    return true;
}

//------------------------------ Schema checks (JSON Schema subset) ------------------------------
//==========================================================================================================
// matchesType
// Purpose: Checks a value against a JSON Schema primitive "type" keyword.
// Notes:
//   "integer" accepts integral doubles; unknown type names are accepted (schema is authoritative elsewhere).
//==========================================================================================================
inline bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "number") return v.isNumber();
    if (type == "integer") {
        if (std::holds_alternative<int64_t>(v.value)) return true;
        if (std::holds_alternative<double>(v.value)) {
            double d = std::get<double>(v.value);
            return d == static_cast<double>(static_cast<int64_t>(d));
        }
        return false;
    }
    if (type == "string") return v.isString();
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "array") return v.isArray();
    if (type == "object") return v.isObject();
    if (type == "null") return v.isNull();
    return true;
}

//==========================================================================================================
// validateAgainstSchema
// Purpose: Validates a value against the subset of JSON Schema used by tool input schemas:
//          type, properties, required, items, minItems, enum.
// Args:
//   value: The value to check (tool arguments at the top level).
//   schema: The schema object; non-object schemas accept everything.
//   path: Location prefix used in the returned detail (e.g. "arguments").
// Returns:
//   std::nullopt when valid; otherwise a human readable violation detail.
//==========================================================================================================
inline std::optional<std::string> validateAgainstSchema(const JSONValue& value, const JSONValue& schema,
                                                        const std::string& path) {
    if (!schema.isObject()) return std::nullopt;

    if (auto type = json::getString(schema, "type")) {
        if (!matchesType(value, type.value())) {
            return "'" + path + "' must be of type " + type.value();
        }
    }

    if (const JSONValue* en = json::member(schema, "enum"); en && en->isArray()) {
        bool found = false;
        for (const auto& candidate : std::get<JSONValue::Array>(en->value)) {
            if (candidate && *candidate == value) { found = true; break; }
        }
        if (!found) return "'" + path + "' is not one of the allowed values";
    }

    if (value.isObject()) {
        if (const JSONValue* req = json::member(schema, "required"); req && req->isArray()) {
            for (const auto& r : std::get<JSONValue::Array>(req->value)) {
                if (!r || !r->isString()) continue;
                const std::string& key = std::get<std::string>(r->value);
                if (json::member(value, key) == nullptr) {
                    return "missing required parameter '" + key + "'";
                }
            }
        }
        if (const JSONValue* props = json::member(schema, "properties"); props && props->isObject()) {
            for (const auto& [key, sub] : std::get<JSONValue::Object>(props->value)) {
                const JSONValue* field = json::member(value, key);
                if (!field || !sub) continue;
                auto detail = validateAgainstSchema(*field, *sub, key);
                if (detail.has_value()) return detail;
            }
        }
    }

    if (value.isArray()) {
        const auto& arr = std::get<JSONValue::Array>(value.value);
        if (auto minItems = json::getNumber(schema, "minItems")) {
            if (static_cast<double>(arr.size()) < minItems.value()) {
                return "'" + path + "' must contain at least " +
                       std::to_string(static_cast<int64_t>(minItems.value())) + " item(s)";
            }
        }
        if (const JSONValue* items = json::member(schema, "items"); items && items->isObject()) {
            for (std::size_t i = 0; i < arr.size(); ++i) {
                if (!arr[i]) continue;
                auto detail = validateAgainstSchema(*arr[i], *items, path + "[" + std::to_string(i) + "]");
                if (detail.has_value()) return detail;
            }
        }
    }
    return std::nullopt;
}

// Validates tools/call arguments against a tool's input schema.
inline std::optional<std::string> validateToolArguments(const Tool& tool, const JSONValue& arguments) {
    return validateAgainstSchema(arguments, tool.inputSchema, "arguments");
}

} // namespace validation
} // namespace mcpchain
