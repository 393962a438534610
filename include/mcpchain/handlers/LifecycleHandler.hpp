//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LifecycleHandler.hpp
// Purpose: Protocol lifecycle handler: initialize, ping, notifications/initialized, client pings
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "mcpchain/ClientRequestTracker.h"
#include "mcpchain/Handler.h"
#include "mcpchain/Protocol.h"

namespace mcpchain {
namespace handlers {

//==========================================================================================================
// LifecycleLimits
// Purpose: Bounds on the state the lifecycle handler keeps for client-chosen session ids.
// Fields:
//   maxSessions: Session records kept at once; the least recently seen one is evicted beyond it (> 0).
//   sessionIdleTimeout: Records not seen for this long are dropped (0 = never).
//   clientRequests: Limits of the tracker holding pings sent to the client.
//==========================================================================================================
struct LifecycleLimits {
    std::size_t maxSessions{1024};
    std::chrono::milliseconds sessionIdleTimeout{std::chrono::minutes(30)};
    ClientRequestLimits clientRequests{};
};

//==========================================================================================================
// LifecycleHandler
// Purpose: Answers the session-level methods so tool handlers never see them.
// Behavior:
//   initialize -> { protocolVersion, capabilities: { tools: {} }, serverInfo }
//   ping       -> {}
//   tools/list -> discovery merge with no own tools ({"tools":[]} when nothing downstream lists tools)
//   notifications/initialized -> marks the context session (if initialize created it), then forwarded
//   responses  -> routed to pending client pings; others forwarded
//   anything else is forwarded unchanged
// Notes:
//   - The session records and the request tracker are the only mutable state; both are mutex-guarded
//     and bounded by LifecycleLimits. Only initialize creates a record.
//==========================================================================================================
class LifecycleHandler : public HandlerBase {
public:
    struct SessionState {
        bool initialized{false};
        std::string protocolVersion;
        std::optional<Implementation> clientInfo;
        std::chrono::steady_clock::time_point lastSeen;
    };

    explicit LifecycleHandler(Implementation serverInfo, LifecycleLimits limits = LifecycleLimits{});
    LifecycleHandler();

    std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx,
                                                   const JSONRPCRequest& request,
                                                   const Downstream& next) override;

    void HandleNotification(const RequestContext& ctx,
                            const JSONRPCNotification& notification,
                            const Downstream& next) override;

    void HandleResponse(const RequestContext& ctx,
                        const JSONRPCResponse& response,
                        const Downstream& next) override;

    //==========================================================================================================
    // Sends a ping to the client over the context stream.
    // Args:
    //   ctx: Context whose stream reaches the client.
    //   onReply: Invoked with the client's reply when it arrives through HandleResponse.
    // Returns:
    //   The request id, or std::nullopt when the context has no open stream.
    //==========================================================================================================
    std::optional<JSONRPCId> PingClient(const RequestContext& ctx, std::function<void(const JSONRPCResponse&)> onReply);

    // Snapshot of the record for a session id (the empty id is the anonymous session); idle records are absent.
    std::optional<SessionState> GetSession(const std::string& sessionId) const;

    std::size_t SessionCount() const;

    std::size_t PendingClientRequests() const { return tracker_.PendingCount(); }

private:
    std::unique_ptr<JSONRPCResponse> handleInitialize(const RequestContext& ctx, const JSONRPCRequest& request);

    bool isIdle(const SessionState& state, std::chrono::steady_clock::time_point now) const;
    void expireIdleSessionsLocked(std::chrono::steady_clock::time_point now);
    SessionState& upsertSessionLocked(const std::string& sessionId, std::chrono::steady_clock::time_point now);

    Implementation serverInfo_;
    LifecycleLimits limits_;
    ClientRequestTracker tracker_;
    mutable std::mutex sessionsMutex_;
    std::map<std::string, SessionState> sessions_;
};

} // namespace handlers
} // namespace mcpchain
