//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcEndpoint.cpp
// Purpose: Wire decoding/encoding around the chain head
//==========================================================================================================

#include "mcpchain/JsonRpcEndpoint.h"
#include "mcpchain/JsonAccess.h"
#include "logging/Logger.h"

#include <stdexcept>

namespace mcpchain {

JsonRpcEndpoint::JsonRpcEndpoint(std::shared_ptr<const Chain> chain)
    : chain_(std::move(chain)), router_(MakeDefaultJsonRpcMessageRouter()) {
    if (!chain_) {
        throw std::invalid_argument("JsonRpcEndpoint requires a chain");
    }
}

RequestContext JsonRpcEndpoint::makeContext(const Session& session, const std::optional<JSONValue>& params) const {
    RequestContext::Fields f;
    f.traceId = GenerateTraceId();
    f.sessionId = session.sessionId;
    f.authToken = session.authToken;
    f.authData = session.authData;
    f.stream = session.stream;
    if (params.has_value()) {
        if (const JSONValue* meta = json::member(params.value(), "_meta")) {
            if (const JSONValue* token = json::member(*meta, "progressToken")) {
                if (token->isString() || std::holds_alternative<int64_t>(token->value)) {
                    f.progressToken = *token;
                }
            }
        }
    }
    return RequestContext(std::move(f));
}

std::optional<JSONRPCResponse> JsonRpcEndpoint::deliverOne(const JSONValue& message, const Session& session) {
    RouterHandlers handlers;
    handlers.requestHandler = [this, &session](const JSONRPCRequest& request) {
        const RequestContext ctx = makeContext(session, request.params);
        LOG_DEBUG("-> {} id={} (trace={})", request.method, IdToString(request.id), ctx.TraceId());
        auto response = chain_->HandleRequest(ctx, request);
        LOG_DEBUG("<- id={} {} (trace={})", IdToString(response->id),
                  response->IsError() ? "error" : "result", ctx.TraceId());
        return response;
    };
    handlers.notificationHandler = [this, &session](const JSONRPCNotification& notification) {
        const RequestContext ctx = makeContext(session, notification.params);
        chain_->HandleNotification(ctx, notification);
    };
    handlers.responseHandler = [this, &session](const JSONRPCResponse& response) {
        const RequestContext ctx = makeContext(session, std::nullopt);
        chain_->HandleResponse(ctx, response);
    };
    return router_->route(message, handlers);
}

std::optional<std::string> JsonRpcEndpoint::Deliver(const std::string& raw) {
    return Deliver(raw, Session{});
}

std::optional<std::string> JsonRpcEndpoint::Deliver(const std::string& raw, const Session& session) {
    JSONValue message;
    try {
        message = ParseJSON(raw);
    } catch (const std::exception& e) {
        LOG_WARN("Endpoint: parse error: {}", e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError,
                                   std::string("Parse error: ") + e.what())->Serialize();
    }

    try {
        if (message.isArray()) {
            const auto& items = std::get<JSONValue::Array>(message.value);
            if (items.empty()) {
                return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest,
                                           "Invalid Request: empty batch")->Serialize();
            }
            JSONValue::Array out;
            for (const auto& item : items) {
                auto resp = deliverOne(item ? *item : JSONValue{}, session);
                if (resp.has_value()) {
                    out.push_back(std::make_shared<JSONValue>(resp->ToValue()));
                }
            }
            if (out.empty()) {
                return std::nullopt;
            }
            return SerializeJSON(JSONValue{std::move(out)});
        }

        auto resp = deliverOne(message, session);
        if (!resp.has_value()) {
            return std::nullopt;
        }
        return resp->Serialize();
    } catch (const std::exception& e) {
        LOG_ERROR("Endpoint: delivery failed: {}", e.what());
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InternalError,
                                   std::string("Internal error: ") + e.what())->Serialize();
    }
}

} // namespace mcpchain
