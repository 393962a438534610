//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcMessageRouter.h
// Purpose: Interface for JSON-RPC message routing (classification and dispatch of one message)
//========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {

struct RouterHandlers {
    std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)> requestHandler;
    std::function<void(const JSONRPCNotification&)> notificationHandler;
    std::function<void(const JSONRPCResponse&)> responseHandler;
    std::function<void(const std::string& error)> errorHandler;
};

class IJsonRpcMessageRouter {
public:
    virtual ~IJsonRpcMessageRouter() = default;

    enum class MessageKind {
        Request,
        Response,
        Notification,
        Unknown
    };

    // Classify a parsed JSON-RPC message without invoking handlers.
    virtual MessageKind classify(const JSONValue& message) = 0;

    // Classify raw text; malformed JSON is Unknown.
    virtual MessageKind classify(const std::string& json) = 0;

    // Routes one parsed message (not a batch). Returns the response to send back: the handler's
    // response for a request, an InvalidRequest error for a non-conforming message, and std::nullopt
    // for notifications and responses.
    virtual std::optional<JSONRPCResponse> route(const JSONValue& message, RouterHandlers& handlers) = 0;
};

// Factory: returns the default router implementation
std::unique_ptr<IJsonRpcMessageRouter> MakeDefaultJsonRpcMessageRouter();

} // namespace mcpchain
