//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHandler.cpp
// Purpose: Local dispatch of tools/call and the tools/list discovery merge
//==========================================================================================================

#include "mcpchain/ToolHandler.h"
#include "mcpchain/errors/Errors.h"
#include "mcpchain/validation/Validators.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace mcpchain {

std::unique_ptr<JSONRPCResponse> ToolHandlerBase::HandleRequest(const RequestContext& ctx,
                                                                const JSONRPCRequest& request,
                                                                const Downstream& next) {
    if (request.method == Methods::ListTools) {
        return MergeToolsList(GetName(), ctx, request, next, tools_);
    }
    if (request.method == Methods::CallTool) {
        return handleToolsCall(ctx, request, next);
    }
    return next.HandleRequest(ctx, request);
}

std::vector<std::string> ToolHandlerBase::GetProvidedTools() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& t : tools_) {
        out.push_back(t.name);
    }
    return out;
}

void ToolHandlerBase::RegisterTool(Tool tool, ToolFunction fn) {
    if (!fn) {
        throw std::invalid_argument("Tool '" + tool.name + "' registered without a function");
    }
    if (index_.find(tool.name) != index_.end()) {
        throw std::invalid_argument("Tool '" + tool.name + "' registered twice by '" + GetName() + "'");
    }
    index_[tool.name] = tools_.size();
    tools_.push_back(std::move(tool));
    functions_.push_back(std::move(fn));
}

////////////////////////////////////////////// Discovery merge //////////////////////////////////////////////
std::unique_ptr<JSONRPCResponse> MergeToolsList(const std::string& handlerName, const RequestContext& ctx,
                                                const JSONRPCRequest& request, const Downstream& next,
                                                const std::vector<Tool>& ownTools) {
    ToolsListResult merged;
    auto downstream = next.HandleRequest(ctx, request);
    if (downstream->IsError()) {
        auto err = errors::mcpErrorFromResponse(*downstream);
        if (!err.has_value() || err->code != JSONRPCErrorCodes::MethodNotFound) {
            // Not an absence of capability: surface it unchanged.
            return downstream;
        }
        LOG_DEBUG("'{}': nothing downstream answers tools/list; contributing own tools only", handlerName);
    } else {
        std::optional<ToolsListResult> parsed;
        if (downstream->result.has_value() && validation::validateToolsListResultJson(downstream->result.value())) {
            parsed = ToolsListResultFromValue(downstream->result.value());
        }
        if (!parsed.has_value()) {
            LOG_ERROR("'{}': downstream tools/list result is malformed", handlerName);
            return errors::makeErrorResponse(request.id, errors::internalError(
                "'" + handlerName + "' could not decode the downstream tools/list result"));
        }
        merged.tools = std::move(parsed->tools);
    }
    // Own tools after the downstream ones: read from the head, upstream handlers appear last.
    merged.tools.insert(merged.tools.end(), ownTools.begin(), ownTools.end());
    return CreateResultResponse(request.id, ToolsListResultToValue(merged));
}

/////////////////////////////////////////////// Local dispatch ///////////////////////////////////////////////
std::unique_ptr<JSONRPCResponse> ToolHandlerBase::handleToolsCall(const RequestContext& ctx,
                                                                  const JSONRPCRequest& request,
                                                                  const Downstream& next) {
    auto params = ParseCallToolParams(request.params);
    if (!params.has_value()) {
        return errors::makeErrorResponse(request.id, errors::invalidParams(
            "tools/call requires params { name: string, arguments?: object }"));
    }
    auto it = index_.find(params->name);
    if (it == index_.end()) {
        return next.HandleRequest(ctx, request);
    }
    const Tool& tool = tools_[it->second];
    if (auto violation = validation::validateToolArguments(tool, params->arguments)) {
        LOG_DEBUG("'{}': rejected arguments for '{}': {}", GetName(), tool.name, violation.value());
        return errors::makeErrorResponse(request.id, errors::invalidParams(
            "tool '" + tool.name + "': " + violation.value()));
    }

    try {
        CallToolResult result = functions_[it->second](ctx, request, params.value(), next);
        return CreateResultResponse(request.id, CallToolResultToValue(result));
    } catch (const errors::DownstreamCallError& e) {
        LOG_DEBUG("'{}': tool '{}' failed downstream: {}", GetName(), tool.name, e.what());
        return errors::makeErrorResponse(request.id, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("'{}': tool '{}' failed: {}", GetName(), tool.name, e.what());
        return errors::makeErrorResponse(request.id, errors::internalError(
            "tool '" + tool.name + "' failed: " + e.what()));
    }
}

Tool MakeTool(std::string name, std::string description, const std::string& inputSchemaJson,
              std::optional<std::string> title) {
    return Tool(std::move(name), std::move(description), ParseJSON(inputSchemaJson), std::move(title));
}

//////////////////////////////////////////////// ToolProvider ////////////////////////////////////////////////
void ToolProvider::AddTool(Tool tool, SimpleTool fn) {
    if (!fn) {
        throw std::invalid_argument("Tool '" + tool.name + "' registered without a function");
    }
    RegisterTool(std::move(tool),
        [fn = std::move(fn)](const RequestContext&, const JSONRPCRequest&, const CallToolParams& params,
                             const Downstream&) {
            return fn(params.arguments);
        });
}

///////////////////////////////////////////////// Middleware /////////////////////////////////////////////////
void Middleware::AddComposedTool(Tool tool, ComposedTool fn) {
    if (!fn) {
        throw std::invalid_argument("Tool '" + tool.name + "' registered without a function");
    }
    RegisterTool(std::move(tool),
        [this, fn = std::move(fn)](const RequestContext& ctx, const JSONRPCRequest& request,
                                   const CallToolParams& params, const Downstream& next) {
            DownstreamClient client(ctx, request, next, GetName());
            return fn(ctx, params.arguments, client);
        });
}

} // namespace mcpchain
