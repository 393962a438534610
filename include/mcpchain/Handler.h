//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handler.h
// Purpose: Handler interface - the unit of composition of a chain - and the Downstream continuation
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mcpchain/Context.h"
#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {

class Chain;

//==========================================================================================================
// Downstream
// Purpose: Explicit continuation over the positions of a chain strictly after the current handler.
// Notes:
//   - Cheap value type (chain pointer + position). The chain outlives every traversal through it.
//   - A Downstream at or past the end behaves as the terminal "no handler" sentinel:
//       requests      -> MethodNotFound (for tools/call the message also names the tool)
//       notifications -> dropped (debug log)
//       responses     -> reported as unmatched (warning log)
//   - Exceptions thrown by a handler are converted into an Internal error response for the request.
//==========================================================================================================
class Downstream {
public:
    Downstream() = default;
    Downstream(const Chain* chain, std::size_t position) : chain_(chain), position_(position) {}

    //==========================================================================================================
    // Dispatches a request to the handler at this position.
    // Args:
    //   ctx: Context of the current traversal (propagated unchanged).
    //   request: The request; the returned response always carries request.id.
    // Returns:
    //   Non-null response (result or error).
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx, const JSONRPCRequest& request) const;

    void HandleNotification(const RequestContext& ctx, const JSONRPCNotification& notification) const;

    void HandleResponse(const RequestContext& ctx, const JSONRPCResponse& response) const;

    // True when no handler remains (terminal sentinel).
    bool AtEnd() const;

    std::size_t Position() const { return position_; }

private:
    const Chain* chain_{nullptr};
    std::size_t position_{0};
};

//==========================================================================================================
// IHandler
// Purpose: A request/notification/response processor composable into a chain.
// Notes:
//   - A handler that does not satisfy a request MUST forward it unchanged via next.
//   - Notifications are not exclusively dispatched: a handler may act on one and still forward it.
//   - Handlers are shared read-only across concurrent traversals; any mutable state must be guarded.
//==========================================================================================================
class IHandler {
public:
    virtual ~IHandler() = default;

    // Stable identifier used in diagnostics, nested request ids and error messages.
    virtual std::string GetName() const = 0;

    //==========================================================================================================
    // Handles a request or forwards it.
    // Args:
    //   ctx: Traversal context (read-only).
    //   request: Request to answer.
    //   next: Continuation over the remaining chain positions.
    // Returns:
    //   Non-null response for request.id.
    //==========================================================================================================
    virtual std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx,
                                                           const JSONRPCRequest& request,
                                                           const Downstream& next) = 0;

    virtual void HandleNotification(const RequestContext& ctx,
                                    const JSONRPCNotification& notification,
                                    const Downstream& next) = 0;

    // Routes a reply to an out-of-band request this handler issued; unrecognized replies are forwarded.
    virtual void HandleResponse(const RequestContext& ctx,
                                const JSONRPCResponse& response,
                                const Downstream& next) = 0;

    // Tool names this handler calls downstream (composition order check).
    virtual std::vector<std::string> GetRequiredTools() const { return {}; }

    // Tool names this handler contributes to tools/list.
    virtual std::vector<std::string> GetProvidedTools() const { return {}; }
};

//==========================================================================================================
// HandlerBase
// Purpose: IHandler with pass-through defaults: everything is forwarded downstream unchanged.
//==========================================================================================================
class HandlerBase : public IHandler {
public:
    explicit HandlerBase(std::string name) : name_(std::move(name)) {}

    std::string GetName() const override { return name_; }

    std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx,
                                                   const JSONRPCRequest& request,
                                                   const Downstream& next) override {
        return next.HandleRequest(ctx, request);
    }

    void HandleNotification(const RequestContext& ctx,
                            const JSONRPCNotification& notification,
                            const Downstream& next) override {
        next.HandleNotification(ctx, notification);
    }

    void HandleResponse(const RequestContext& ctx,
                        const JSONRPCResponse& response,
                        const Downstream& next) override {
        next.HandleResponse(ctx, response);
    }

private:
    std::string name_;
};

} // namespace mcpchain
