//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DownstreamClient.h
// Purpose: Nested tools/call invocation into the remainder of a chain, with error translation
//==========================================================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpchain/Handler.h"
#include "mcpchain/Protocol.h"
#include "mcpchain/errors/Errors.h"

namespace mcpchain {

//==========================================================================================================
// DownstreamClient
// Purpose: Used by a middleware handler while it answers one request to call tools positioned after it.
// Notes:
//   - Scoped to one enclosing request: holds references to its context, so it must not outlive it.
//   - Nested ids are strings "<enclosing id>/<caller>#<n>", n = 1, 2, ... per client instance; they never
//     equal the enclosing id.
//   - The enclosing context is propagated unchanged (same trace, stream and session).
//   - Failures are thrown as errors::DownstreamCallError carrying the typed error for the caller's caller:
//       MethodNotFound               -> DownstreamToolMissing (-32011) with the ordering fix in the message
//       any other error, isError     -> DownstreamError (-32010), data { target, cause }
//       undecodable result           -> Internal (-32603), attributed to the caller
//==========================================================================================================
class DownstreamClient {
public:
    DownstreamClient(const RequestContext& ctx, const JSONRPCRequest& enclosing, const Downstream& next,
                     std::string caller);

    DownstreamClient(const DownstreamClient&) = delete;
    DownstreamClient& operator=(const DownstreamClient&) = delete;

    // Mints the next nested request id.
    JSONRPCId NextId();

    //==========================================================================================================
    // Issues a raw nested request (no translation) and returns the downstream response.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Request(const std::string& method, std::optional<JSONValue> params);

    //==========================================================================================================
    // Calls a downstream tool.
    // Args:
    //   tool: Tool name.
    //   arguments: Arguments object.
    // Returns:
    //   The tool result (never isError). Throws errors::DownstreamCallError on failure.
    //==========================================================================================================
    CallToolResult CallTool(const std::string& tool, const JSONValue& arguments);

    // Calls a tool and decodes a single number (structuredContent.value, else the first text item).
    double CallNumber(const std::string& tool, const JSONValue& arguments);

    //==========================================================================================================
    // Issues independent tool calls concurrently.
    // Returns:
    //   Results in the order of calls regardless of completion order. When several calls fail, the
    //   failure of the earliest call (in request order) is thrown after all calls have finished.
    //==========================================================================================================
    std::vector<CallToolResult> CallToolsConcurrently(const std::vector<CallToolParams>& calls);

    std::vector<double> CallNumbersConcurrently(const std::vector<CallToolParams>& calls);

    const std::string& Caller() const { return caller_; }

private:
    CallToolResult translate(const std::string& tool, std::unique_ptr<JSONRPCResponse> response) const;
    double decodeNumber(const std::string& tool, const CallToolResult& result) const;

    const RequestContext& ctx_;
    Downstream next_;
    std::string caller_;
    std::string idPrefix_;
    std::atomic<uint64_t> counter_{0};
};

//==========================================================================================================
// Error builders shared with tests and diagnostics
//==========================================================================================================
errors::McpError MakeDownstreamToolMissing(const std::string& tool, const std::string& requiredBy);
errors::McpError MakeDownstreamError(const std::string& tool, const std::string& causeText, JSONValue cause);

} // namespace mcpchain
