//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ClientRequestTracker.cpp
// Purpose: Out-of-band request bookkeeping
//==========================================================================================================

#include "mcpchain/ClientRequestTracker.h"
#include "logging/Logger.h"

#include <stdexcept>
#include <utility>
#include <vector>

namespace mcpchain {

ClientRequestTracker::ClientRequestTracker(std::string owner, ClientRequestLimits limits)
    : owner_(std::move(owner)), limits_(limits) {
    if (limits_.maxPending == 0) {
        throw std::invalid_argument("ClientRequestTracker '" + owner_ + "': maxPending must be positive");
    }
}

std::optional<JSONRPCId> ClientRequestTracker::Send(const RequestContext& ctx, const std::string& method,
                                                    std::optional<JSONValue> params, Callback onReply) {
    ExpireStale();
    std::string id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_.size() >= limits_.maxPending) {
            LOG_WARN("'{}': {} client requests already awaiting replies; not sending '{}' (trace={})",
                     owner_, pending_.size(), method, ctx.TraceId());
            return std::nullopt;
        }
        id = owner_ + "/out#" + std::to_string(++counter_);
        pending_[id] = Pending{method, std::move(onReply), std::chrono::steady_clock::now()};
    }
    JSONRPCRequest request(JSONRPCId{id}, method, std::move(params));
    if (!ctx.SendRequest(request)) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        LOG_WARN("'{}': client stream rejected out-of-band '{}' (trace={})", owner_, method, ctx.TraceId());
        return std::nullopt;
    }
    LOG_DEBUG("'{}': sent out-of-band '{}' id={}", owner_, method, id);
    return JSONRPCId{id};
}

bool ClientRequestTracker::IsPending(const JSONRPCId& id) const {
    if (!std::holds_alternative<std::string>(id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(std::get<std::string>(id)) != pending_.end();
}

bool ClientRequestTracker::Complete(const JSONRPCResponse& response) {
    if (!std::holds_alternative<std::string>(response.id)) {
        return false;
    }
    Pending entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(std::get<std::string>(response.id));
        if (it == pending_.end()) {
            return false;
        }
        entry = std::move(it->second);
        pending_.erase(it);
    }
    // Callback runs outside the lock so it may issue further requests.
    if (entry.onReply) {
        entry.onReply(response);
    }
    return true;
}

std::size_t ClientRequestTracker::PendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t ClientRequestTracker::ExpireStale() {
    if (limits_.replyTimeout.count() <= 0) {
        return 0;
    }
    std::vector<std::pair<std::string, Pending>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::steady_clock::now();
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (now - it->second.sentAt >= limits_.replyTimeout) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Callbacks run outside the lock, as in Complete().
    for (auto& [id, entry] : expired) {
        LOG_WARN("'{}': no client reply to '{}' id={} within {} ms", owner_, entry.method, id,
                 limits_.replyTimeout.count());
        if (entry.onReply) {
            auto timeout = CreateErrorResponse(JSONRPCId{id}, JSONRPCErrorCodes::InternalError,
                "No reply from client to '" + entry.method + "' within " +
                std::to_string(limits_.replyTimeout.count()) + " ms");
            entry.onReply(*timeout);
        }
    }
    return expired.size();
}

} // namespace mcpchain
