//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.cpp
// Purpose: Default implementation for JSON-RPC message routing
//========================================================================================================

#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcpchain/JsonRpcMessageRouter.h"
#include "mcpchain/JsonAccess.h"

namespace mcpchain {

namespace {

bool hasKey(const JSONValue& v, const char* key) {
    if (!v.isObject()) return false;
    const auto& o = std::get<JSONValue::Object>(v.value);
    return o.find(key) != o.end();
}

// Best-effort id echo for an InvalidRequest answer; null when absent or not a valid id.
JSONRPCId extractId(const JSONValue& v) {
    const JSONValue* id = json::member(v, "id");
    if (id == nullptr) return nullptr;
    if (std::holds_alternative<std::string>(id->value)) return std::get<std::string>(id->value);
    if (std::holds_alternative<int64_t>(id->value)) return std::get<int64_t>(id->value);
    return nullptr;
}

class JsonRpcMessageRouter : public IJsonRpcMessageRouter {
public:
    MessageKind classify(const JSONValue& message) override {
        if (!message.isObject()) {
            return MessageKind::Unknown;
        }
        if (hasKey(message, "method")) {
            return hasKey(message, "id") ? MessageKind::Request : MessageKind::Notification;
        }
        if (hasKey(message, "result") || hasKey(message, "error")) {
            return MessageKind::Response;
        }
        return MessageKind::Unknown;
    }

    MessageKind classify(const std::string& json) override {
        try {
            return classify(ParseJSON(json));
        } catch (const std::exception& e) {
            LOG_DEBUG("Router: classify on malformed JSON: {}", e.what());
            return MessageKind::Unknown;
        }
    }

    std::optional<JSONRPCResponse> route(const JSONValue& message, RouterHandlers& handlers) override {
        switch (classify(message)) {
            case MessageKind::Request: {
                JSONRPCRequest request;
                if (!request.FromValue(message)) {
                    return invalid(message, handlers, "malformed request");
                }
                if (!handlers.requestHandler) {
                    return *CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                                "Method not found: " + request.method);
                }
                try {
                    auto resp = handlers.requestHandler(request);
                    if (!resp) {
                        return *CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                                    "Null response from handler");
                    }
                    resp->id = request.id;
                    return std::move(*resp);
                } catch (const std::exception& e) {
                    LOG_ERROR("Request handler exception: {}", e.what());
                    return *CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, e.what());
                }
            }
            case MessageKind::Notification: {
                JSONRPCNotification notification;
                if (!notification.FromValue(message)) {
                    // Notifications are never answered, not even with an error.
                    LOG_WARN("Router: dropping malformed notification");
                    if (handlers.errorHandler) handlers.errorHandler("Router: malformed notification");
                    return std::nullopt;
                }
                if (handlers.notificationHandler) {
                    handlers.notificationHandler(notification);
                }
                return std::nullopt;
            }
            case MessageKind::Response: {
                JSONRPCResponse response;
                if (!response.FromValue(message)) {
                    LOG_WARN("Router: dropping malformed response");
                    if (handlers.errorHandler) handlers.errorHandler("Router: malformed response");
                    return std::nullopt;
                }
                if (handlers.responseHandler) {
                    handlers.responseHandler(response);
                }
                return std::nullopt;
            }
            case MessageKind::Unknown:
            default:
                return invalid(message, handlers, "not a JSON-RPC 2.0 message");
        }
    }

private:
    std::optional<JSONRPCResponse> invalid(const JSONValue& message, RouterHandlers& handlers, const std::string& why) {
        LOG_WARN("Router: invalid JSON-RPC message ({})", why);
        if (handlers.errorHandler) {
            handlers.errorHandler("Router: " + why);
        }
        return *CreateErrorResponse(extractId(message), JSONRPCErrorCodes::InvalidRequest, "Invalid Request: " + why);
    }
};
} // namespace

std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter() {
    return std::make_unique<JsonRpcMessageRouter>();
}

} // namespace mcpchain
