//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DownstreamClient.cpp
// Purpose: Nested call issuing, result decoding and downstream error translation
//==========================================================================================================

#include "mcpchain/DownstreamClient.h"
#include "mcpchain/JsonAccess.h"
#include "mcpchain/typed/Content.h"
#include "mcpchain/validation/Validators.h"
#include "logging/Logger.h"

#include <exception>
#include <future>

namespace mcpchain {

errors::McpError MakeDownstreamToolMissing(const std::string& tool, const std::string& requiredBy) {
    JSONValue::Object data;
    json::set(data, "tool", JSONValue{tool});
    json::set(data, "requiredBy", JSONValue{requiredBy});
    return errors::makeError(JSONRPCErrorCodes::DownstreamToolMissing,
        "Tool '" + tool + "' required by '" + requiredBy + "' was not found downstream. "
        "Compose the handler that provides '" + tool + "' after '" + requiredBy + "' in the pipeline.",
        JSONValue{std::move(data)});
}

errors::McpError MakeDownstreamError(const std::string& tool, const std::string& causeText, JSONValue cause) {
    JSONValue::Object data;
    json::set(data, "target", JSONValue{tool});
    json::set(data, "cause", std::move(cause));
    return errors::makeError(JSONRPCErrorCodes::DownstreamError,
                             "Downstream call to '" + tool + "' failed: " + causeText,
                             JSONValue{std::move(data)});
}

DownstreamClient::DownstreamClient(const RequestContext& ctx, const JSONRPCRequest& enclosing,
                                   const Downstream& next, std::string caller)
    : ctx_(ctx), next_(next), caller_(std::move(caller)) {
    idPrefix_ = IdToString(enclosing.id) + "/" + caller_ + "#";
}

JSONRPCId DownstreamClient::NextId() {
    const uint64_t n = counter_.fetch_add(1) + 1;
    return JSONRPCId{idPrefix_ + std::to_string(n)};
}

std::unique_ptr<JSONRPCResponse> DownstreamClient::Request(const std::string& method, std::optional<JSONValue> params) {
    JSONRPCRequest nested(NextId(), method, std::move(params));
    LOG_DEBUG("'{}' -> {} (id={}, position={}, trace={})",
              caller_, method, IdToString(nested.id), next_.Position(), ctx_.TraceId());
    return next_.HandleRequest(ctx_, nested);
}

CallToolResult DownstreamClient::CallTool(const std::string& tool, const JSONValue& arguments) {
    CallToolParams p;
    p.name = tool;
    p.arguments = arguments;
    return translate(tool, Request(Methods::CallTool, CallToolParamsToValue(p)));
}

double DownstreamClient::CallNumber(const std::string& tool, const JSONValue& arguments) {
    return decodeNumber(tool, CallTool(tool, arguments));
}

std::vector<CallToolResult> DownstreamClient::CallToolsConcurrently(const std::vector<CallToolParams>& calls) {
    std::vector<std::future<CallToolResult>> futures;
    futures.reserve(calls.size());
    for (const auto& call : calls) {
        futures.push_back(std::async(std::launch::async, [this, &call]() {
            return CallTool(call.name, call.arguments);
        }));
    }

    // Every future is joined before anything is rethrown: the tasks reference this client and ctx_.
    std::vector<CallToolResult> results;
    results.reserve(calls.size());
    std::exception_ptr firstFailure;
    for (auto& f : futures) {
        try {
            results.push_back(f.get());
        } catch (const std::exception&) {
            if (!firstFailure) {
                firstFailure = std::current_exception();
            }
            results.emplace_back();
        }
    }
    if (firstFailure) {
        std::rethrow_exception(firstFailure);
    }
    return results;
}

std::vector<double> DownstreamClient::CallNumbersConcurrently(const std::vector<CallToolParams>& calls) {
    const auto results = CallToolsConcurrently(calls);
    std::vector<double> out;
    out.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i) {
        out.push_back(decodeNumber(calls[i].name, results[i]));
    }
    return out;
}

CallToolResult DownstreamClient::translate(const std::string& tool, std::unique_ptr<JSONRPCResponse> response) const {
    if (!response) {
        throw errors::DownstreamCallError(errors::internalError("'" + caller_ + "' received no response from '" + tool + "'"));
    }
    if (response->IsError()) {
        auto err = errors::mcpErrorFromResponse(*response);
        if (!err.has_value()) {
            throw errors::DownstreamCallError(MakeDownstreamError(tool, "malformed error object", response->error.value()));
        }
        if (err->code == JSONRPCErrorCodes::MethodNotFound) {
            LOG_WARN("'{}' could not reach tool '{}' downstream (trace={})", caller_, tool, ctx_.TraceId());
            throw errors::DownstreamCallError(MakeDownstreamToolMissing(tool, caller_));
        }
        throw errors::DownstreamCallError(MakeDownstreamError(tool, err->message, response->error.value()));
    }

    const JSONValue payload = response->result.has_value() ? response->result.value() : JSONValue{};
    if (!validation::validateCallToolResultJson(payload)) {
        throw errors::DownstreamCallError(errors::internalError(
            "'" + caller_ + "' could not decode the result of '" + tool + "'"));
    }
    auto result = CallToolResultFromValue(payload);
    if (!result.has_value()) {
        throw errors::DownstreamCallError(errors::internalError(
            "'" + caller_ + "' could not decode the result of '" + tool + "'"));
    }
    if (result->isError) {
        const std::string text = typed::firstText(result.value()).value_or("tool reported an error");
        throw errors::DownstreamCallError(MakeDownstreamError(tool, text, payload));
    }
    return std::move(result.value());
}

double DownstreamClient::decodeNumber(const std::string& tool, const CallToolResult& result) const {
    auto value = typed::numberValue(result);
    if (!value.has_value()) {
        throw errors::DownstreamCallError(errors::internalError(
            "'" + caller_ + "' expected a numeric result from '" + tool + "'"));
    }
    return value.value();
}

} // namespace mcpchain
