//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and their JSON mappings
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <utility>
#include <vector>
#include <optional>

namespace mcpchain {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures and method names used by handlers and transports.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
//==========================================================================================================
// Tool
// Purpose: Tool descriptor as advertised by tools/list.
// Fields:
//   name: Unique name within the contributing handler.
//   inputSchema: JSON Schema (object) describing tools/call arguments.
//   description/title/outputSchema/annotations/meta: Optional descriptor fields (meta is "_meta" on the wire).
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::optional<std::string> title;
    std::optional<JSONValue> outputSchema;
    std::optional<JSONValue> annotations;
    std::optional<JSONValue> meta;

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{},
         std::optional<std::string> title = std::nullopt)
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)), title(std::move(title)) {}
};

struct CallToolParams {
    std::string name;
    JSONValue arguments;    // Object; empty object when the caller omitted it
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
    std::optional<JSONValue> structuredContent;
};

struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Log = "notifications/message";
    constexpr const char* Cancelled = "notifications/cancelled";
}

///////////////////////////////////////// JSON mappings ///////////////////////////////////////////
// Tool descriptor <-> { name, inputSchema, description?, title?, outputSchema?, annotations?, _meta? }
JSONValue ToolToValue(const Tool& tool);
std::optional<Tool> ToolFromValue(const JSONValue& value);

// { tools: [...], nextCursor? }
JSONValue ToolsListResultToValue(const ToolsListResult& result);
// Returns std::nullopt when the payload is not a tools/list result (no "tools" array).
std::optional<ToolsListResult> ToolsListResultFromValue(const JSONValue& value);

// { content: [...], isError?, structuredContent? }
JSONValue CallToolResultToValue(const CallToolResult& result);
std::optional<CallToolResult> CallToolResultFromValue(const JSONValue& value);

//==========================================================================================================
// ParseCallToolParams
// Purpose: Extracts { name, arguments } from tools/call params.
// Returns:
//   std::nullopt when params are absent, not an object, lack a string "name", or carry non-object arguments.
//==========================================================================================================
std::optional<CallToolParams> ParseCallToolParams(const std::optional<JSONValue>& params);

JSONValue CallToolParamsToValue(const CallToolParams& params);

} // namespace mcpchain
