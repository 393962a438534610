//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON mappings for MCP tool descriptors, tool results and tools/call params
//==========================================================================================================

#include "mcpchain/Protocol.h"
#include "mcpchain/JsonAccess.h"

namespace mcpchain {

JSONValue ToolToValue(const Tool& tool) {
    JSONValue::Object o;
    json::set(o, "name", JSONValue{tool.name});
    if (!tool.description.empty()) {
        json::set(o, "description", JSONValue{tool.description});
    }
    if (tool.inputSchema.isObject()) {
        json::set(o, "inputSchema", tool.inputSchema);
    } else {
        // MCP requires an object schema; default to an unconstrained object.
        JSONValue::Object schema;
        json::set(schema, "type", JSONValue{std::string("object")});
        json::set(o, "inputSchema", JSONValue{std::move(schema)});
    }
    if (tool.title.has_value()) json::set(o, "title", JSONValue{tool.title.value()});
    if (tool.outputSchema.has_value()) json::set(o, "outputSchema", tool.outputSchema.value());
    if (tool.annotations.has_value()) json::set(o, "annotations", tool.annotations.value());
    if (tool.meta.has_value()) json::set(o, "_meta", tool.meta.value());
    return JSONValue{std::move(o)};
}

std::optional<Tool> ToolFromValue(const JSONValue& value) {
    auto name = json::getString(value, "name");
    if (!name.has_value()) return std::nullopt;
    Tool t;
    t.name = name.value();
    t.description = json::getString(value, "description").value_or("");
    if (const JSONValue* s = json::member(value, "inputSchema")) t.inputSchema = *s;
    t.title = json::getString(value, "title");
    if (const JSONValue* s = json::member(value, "outputSchema")) t.outputSchema = *s;
    if (const JSONValue* a = json::member(value, "annotations")) t.annotations = *a;
    if (const JSONValue* m = json::member(value, "_meta")) t.meta = *m;
    return t;
}

JSONValue ToolsListResultToValue(const ToolsListResult& result) {
    JSONValue::Array arr;
    arr.reserve(result.tools.size());
    for (const auto& t : result.tools) {
        arr.push_back(std::make_shared<JSONValue>(ToolToValue(t)));
    }
    JSONValue::Object o;
    json::set(o, "tools", JSONValue{std::move(arr)});
    if (result.nextCursor.has_value()) {
        json::set(o, "nextCursor", JSONValue{result.nextCursor.value()});
    }
    return JSONValue{std::move(o)};
}

std::optional<ToolsListResult> ToolsListResultFromValue(const JSONValue& value) {
    const JSONValue* tools = json::member(value, "tools");
    if (!tools || !tools->isArray()) return std::nullopt;
    ToolsListResult out;
    for (const auto& item : std::get<JSONValue::Array>(tools->value)) {
        if (!item) continue;
        auto t = ToolFromValue(*item);
        if (!t.has_value()) return std::nullopt;
        out.tools.push_back(std::move(t.value()));
    }
    out.nextCursor = json::getString(value, "nextCursor");
    return out;
}

JSONValue CallToolResultToValue(const CallToolResult& result) {
    JSONValue::Array arr;
    arr.reserve(result.content.size());
    for (const auto& c : result.content) {
        arr.push_back(std::make_shared<JSONValue>(c));
    }
    JSONValue::Object o;
    json::set(o, "content", JSONValue{std::move(arr)});
    if (result.isError) {
        json::set(o, "isError", JSONValue{true});
    }
    if (result.structuredContent.has_value()) {
        json::set(o, "structuredContent", result.structuredContent.value());
    }
    return JSONValue{std::move(o)};
}

std::optional<CallToolResult> CallToolResultFromValue(const JSONValue& value) {
    const JSONValue* content = json::member(value, "content");
    if (!content || !content->isArray()) return std::nullopt;
    CallToolResult out;
    for (const auto& item : std::get<JSONValue::Array>(content->value)) {
        if (item) out.content.push_back(*item);
    }
    out.isError = json::getBool(value, "isError").value_or(false);
    if (const JSONValue* sc = json::member(value, "structuredContent")) {
        out.structuredContent = *sc;
    }
    return out;
}

std::optional<CallToolParams> ParseCallToolParams(const std::optional<JSONValue>& params) {
    if (!params.has_value() || !params->isObject()) return std::nullopt;
    auto name = json::getString(params.value(), "name");
    if (!name.has_value() || name->empty()) return std::nullopt;
    CallToolParams out;
    out.name = name.value();
    const JSONValue* args = json::member(params.value(), "arguments");
    if (args == nullptr || args->isNull()) {
        out.arguments = JSONValue{JSONValue::Object{}};
    } else if (args->isObject()) {
        out.arguments = *args;
    } else {
        return std::nullopt;
    }
    return out;
}

JSONValue CallToolParamsToValue(const CallToolParams& params) {
    JSONValue::Object o;
    json::set(o, "name", JSONValue{params.name});
    json::set(o, "arguments", params.arguments.isObject() ? params.arguments : JSONValue{JSONValue::Object{}});
    return JSONValue{std::move(o)};
}

} // namespace mcpchain
