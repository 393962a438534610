//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientRequestTracker.h
// Purpose: Bookkeeping for server-to-client requests a handler issued, matched by HandleResponse
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "mcpchain/Context.h"
#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {

//==========================================================================================================
// ClientRequestLimits
// Purpose: Bounds on the out-of-band requests one tracker keeps while waiting for client replies.
// Fields:
//   maxPending: Requests awaiting a reply at once; Send() refuses beyond it (must be > 0).
//   replyTimeout: Age after which a request is failed and forgotten (0 = wait indefinitely).
//==========================================================================================================
struct ClientRequestLimits {
    std::size_t maxPending{64};
    std::chrono::milliseconds replyTimeout{std::chrono::seconds(30)};
};

//==========================================================================================================
// ClientRequestTracker
// Purpose: Explicitly injected, mutex-protected record of out-of-band requests awaiting a client reply.
// Notes:
//   - Ids are strings "<owner>/out#<n>" so replies to different owners never collide.
//   - Complete() removes the entry; a reply is delivered to its callback exactly once.
//   - A request that outlives replyTimeout is completed with an InternalError reply instead.
//==========================================================================================================
class ClientRequestTracker {
public:
    using Callback = std::function<void(const JSONRPCResponse&)>;

    explicit ClientRequestTracker(std::string owner, ClientRequestLimits limits = ClientRequestLimits{});

    //==========================================================================================================
    // Sends a request to the client through the context stream and records it.
    // Args:
    //   ctx: Context carrying the client stream.
    //   method: Server-to-client method.
    //   params: Optional params.
    //   onReply: Invoked from Complete() with the reply.
    // Returns:
    //   The minted id, or std::nullopt when maxPending requests are already waiting or the context stream
    //   did not accept the request.
    //==========================================================================================================
    std::optional<JSONRPCId> Send(const RequestContext& ctx, const std::string& method,
                                  std::optional<JSONValue> params, Callback onReply);

    // True when id belongs to a pending request of this tracker.
    bool IsPending(const JSONRPCId& id) const;

    // Delivers the reply to its callback and forgets the request; false for unknown ids.
    bool Complete(const JSONRPCResponse& response);

    std::size_t PendingCount() const;

    //==========================================================================================================
    // Fails every request older than replyTimeout: its callback receives an InternalError reply carrying
    // the request id. Called by Send(); owners may also call it periodically.
    // Returns:
    //   Number of requests expired.
    //==========================================================================================================
    std::size_t ExpireStale();

private:
    struct Pending {
        std::string method;
        Callback onReply;
        std::chrono::steady_clock::time_point sentAt;
    };

    std::string owner_;
    ClientRequestLimits limits_;
    mutable std::mutex mutex_;
    uint64_t counter_{0};
    std::unordered_map<std::string, Pending> pending_;
};

} // namespace mcpchain
