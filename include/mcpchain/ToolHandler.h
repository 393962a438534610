//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHandler.h
// Purpose: Tool-providing and middleware handler bases: local dispatch and the discovery merge
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mcpchain/Handler.h"
#include "mcpchain/Protocol.h"
#include "mcpchain/DownstreamClient.h"

namespace mcpchain {

//==========================================================================================================
// MergeToolsList
// Purpose: The discovery merge every handler that advertises tools performs for tools/list.
// Behavior:
//   Forwards the request downstream. MethodNotFound contributes an empty list; any other error is
//   returned unchanged; a malformed list becomes InternalError. ownTools are appended after the
//   downstream tools and nextCursor is never emitted.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> MergeToolsList(const std::string& handlerName, const RequestContext& ctx,
                                                const JSONRPCRequest& request, const Downstream& next,
                                                const std::vector<Tool>& ownTools);

//==========================================================================================================
// ToolHandlerBase
// Purpose: Handler owning a fixed set of tools registered at construction.
// Behavior:
//   tools/list  -> discovery merge: forward downstream (MethodNotFound = empty list), append own tools
//                  after the downstream ones, never emit nextCursor. Other downstream errors propagate.
//   tools/call  -> own tool: validate arguments against inputSchema (InvalidParams, never forwarded),
//                  execute, answer. Any other tool is forwarded unchanged.
//   otherwise   -> forwarded unchanged.
//==========================================================================================================
class ToolHandlerBase : public HandlerBase {
public:
    using ToolFunction = std::function<CallToolResult(const RequestContext& ctx,
                                                      const JSONRPCRequest& request,
                                                      const CallToolParams& params,
                                                      const Downstream& next)>;

    std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx,
                                                   const JSONRPCRequest& request,
                                                   const Downstream& next) override;

    std::vector<std::string> GetProvidedTools() const override;

    const std::vector<Tool>& Tools() const { return tools_; }

protected:
    explicit ToolHandlerBase(std::string name) : HandlerBase(std::move(name)) {}

    // Registers an own tool. Only called from constructors: the set is fixed once the handler is composed.
    void RegisterTool(Tool tool, ToolFunction fn);

private:
    std::unique_ptr<JSONRPCResponse> handleToolsCall(const RequestContext& ctx, const JSONRPCRequest& request,
                                                     const Downstream& next);

    std::vector<Tool> tools_;
    std::vector<ToolFunction> functions_;
    std::unordered_map<std::string, std::size_t> index_;
};

//==========================================================================================================
// ToolProvider
// Purpose: Leaf role - tools computed locally from their arguments alone.
//==========================================================================================================
class ToolProvider : public ToolHandlerBase {
protected:
    using SimpleTool = std::function<CallToolResult(const JSONValue& arguments)>;

    explicit ToolProvider(std::string name) : ToolHandlerBase(std::move(name)) {}

    void AddTool(Tool tool, SimpleTool fn);
};

//==========================================================================================================
// Middleware
// Purpose: Composing role - tools computed by calling tools positioned after this handler.
// Notes:
//   - Declares the downstream tools it needs so ChainBuilder can diagnose misordered chains.
//   - Each invocation gets its own DownstreamClient scoped to the enclosing request.
//==========================================================================================================
class Middleware : public ToolHandlerBase {
public:
    std::vector<std::string> GetRequiredTools() const override { return requiredTools_; }

protected:
    using ComposedTool = std::function<CallToolResult(const RequestContext& ctx,
                                                      const JSONValue& arguments,
                                                      DownstreamClient& downstream)>;

    Middleware(std::string name, std::vector<std::string> requiredTools)
        : ToolHandlerBase(std::move(name)), requiredTools_(std::move(requiredTools)) {}

    void AddComposedTool(Tool tool, ComposedTool fn);

private:
    std::vector<std::string> requiredTools_;
};

//==========================================================================================================
// MakeTool
// Purpose: Builds a tool descriptor from a JSON Schema text. Throws std::runtime_error on malformed JSON.
//==========================================================================================================
Tool MakeTool(std::string name, std::string description, const std::string& inputSchemaJson,
              std::optional<std::string> title = std::nullopt);

} // namespace mcpchain
