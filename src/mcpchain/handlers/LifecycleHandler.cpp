//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LifecycleHandler.cpp
// Purpose: Protocol lifecycle handler implementation
//==========================================================================================================

#include "mcpchain/handlers/LifecycleHandler.hpp"
#include "mcpchain/JsonAccess.h"
#include "mcpchain/ToolHandler.h"
#include "mcpchain/version.h"
#include "logging/Logger.h"

#include <algorithm>
#include <stdexcept>

namespace mcpchain {
namespace handlers {

LifecycleHandler::LifecycleHandler(Implementation serverInfo, LifecycleLimits limits)
    : HandlerBase("lifecycle"), serverInfo_(std::move(serverInfo)), limits_(limits),
      tracker_("lifecycle", limits.clientRequests) {
    if (limits_.maxSessions == 0) {
        throw std::invalid_argument("LifecycleHandler: maxSessions must be positive");
    }
}

LifecycleHandler::LifecycleHandler()
    : LifecycleHandler(Implementation{SERVER_NAME, getVersionString()}) {}

std::unique_ptr<JSONRPCResponse> LifecycleHandler::HandleRequest(const RequestContext& ctx,
                                                                 const JSONRPCRequest& request,
                                                                 const Downstream& next) {
    if (request.method == Methods::Initialize) {
        return handleInitialize(ctx, request);
    }
    if (request.method == Methods::Ping) {
        return CreateResultResponse(request.id, JSONValue{JSONValue::Object{}});
    }
    if (request.method == Methods::ListTools) {
        // initialize advertises tools, so discovery answers even when nothing downstream provides any.
        return MergeToolsList(GetName(), ctx, request, next, {});
    }
    return next.HandleRequest(ctx, request);
}

std::unique_ptr<JSONRPCResponse> LifecycleHandler::handleInitialize(const RequestContext& ctx,
                                                                    const JSONRPCRequest& request) {
    SessionState state;
    state.protocolVersion = PROTOCOL_VERSION;
    if (request.params.has_value()) {
        const JSONValue& params = request.params.value();
        if (auto requested = json::getString(params, "protocolVersion");
            requested.has_value() && requested.value() != PROTOCOL_VERSION) {
            LOG_INFO("lifecycle: client requested protocol {}, answering {}", requested.value(), PROTOCOL_VERSION);
        }
        if (const JSONValue* info = json::member(params, "clientInfo")) {
            state.clientInfo = Implementation{json::getString(*info, "name").value_or(""),
                                              json::getString(*info, "version").value_or("")};
        }
    }
    {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        const auto now = std::chrono::steady_clock::now();
        state.lastSeen = now;
        upsertSessionLocked(ctx.SessionId(), now) = state;
    }
    LOG_INFO("lifecycle: initialize from '{}' (session='{}')",
             state.clientInfo.has_value() ? state.clientInfo->name : std::string("unknown"), ctx.SessionId());

    JSONValue::Object capabilities;
    json::set(capabilities, "tools", JSONValue{JSONValue::Object{}});

    JSONValue::Object info;
    json::set(info, "name", JSONValue{serverInfo_.name});
    json::set(info, "version", JSONValue{serverInfo_.version});

    JSONValue::Object result;
    json::set(result, "protocolVersion", JSONValue{std::string(PROTOCOL_VERSION)});
    json::set(result, "capabilities", JSONValue{std::move(capabilities)});
    json::set(result, "serverInfo", JSONValue{std::move(info)});
    return CreateResultResponse(request.id, JSONValue{std::move(result)});
}

void LifecycleHandler::HandleNotification(const RequestContext& ctx,
                                          const JSONRPCNotification& notification,
                                          const Downstream& next) {
    if (notification.method == Methods::Initialized) {
        std::lock_guard<std::mutex> lock(sessionsMutex_);
        const auto now = std::chrono::steady_clock::now();
        expireIdleSessionsLocked(now);
        auto it = sessions_.find(ctx.SessionId());
        if (it == sessions_.end()) {
            LOG_WARN("lifecycle: notifications/initialized without initialize (session='{}')", ctx.SessionId());
        } else {
            it->second.initialized = true;
            it->second.lastSeen = now;
        }
    }
    // Observed, not consumed: later handlers may care about the same notification.
    next.HandleNotification(ctx, notification);
}

void LifecycleHandler::HandleResponse(const RequestContext& ctx,
                                      const JSONRPCResponse& response,
                                      const Downstream& next) {
    if (tracker_.Complete(response)) {
        return;
    }
    next.HandleResponse(ctx, response);
}

std::optional<JSONRPCId> LifecycleHandler::PingClient(const RequestContext& ctx,
                                                      std::function<void(const JSONRPCResponse&)> onReply) {
    return tracker_.Send(ctx, Methods::Ping, std::nullopt, std::move(onReply));
}

std::optional<LifecycleHandler::SessionState> LifecycleHandler::GetSession(const std::string& sessionId) const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || isIdle(it->second, std::chrono::steady_clock::now())) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t LifecycleHandler::SessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex_);
    return sessions_.size();
}

bool LifecycleHandler::isIdle(const SessionState& state, std::chrono::steady_clock::time_point now) const {
    return limits_.sessionIdleTimeout.count() > 0 && now - state.lastSeen >= limits_.sessionIdleTimeout;
}

void LifecycleHandler::expireIdleSessionsLocked(std::chrono::steady_clock::time_point now) {
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (isIdle(it->second, now)) {
            LOG_DEBUG("lifecycle: dropping idle session '{}'", it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

LifecycleHandler::SessionState& LifecycleHandler::upsertSessionLocked(const std::string& sessionId,
                                                                      std::chrono::steady_clock::time_point now) {
    expireIdleSessionsLocked(now);
    auto it = sessions_.find(sessionId);
    if (it != sessions_.end()) {
        return it->second;
    }
    if (sessions_.size() >= limits_.maxSessions) {
        auto oldest = std::min_element(sessions_.begin(), sessions_.end(), [](const auto& a, const auto& b) {
            return a.second.lastSeen < b.second.lastSeen;
        });
        LOG_WARN("lifecycle: {} sessions open; evicting least recently seen '{}'", sessions_.size(), oldest->first);
        sessions_.erase(oldest);
    }
    return sessions_[sessionId];
}

} // namespace handlers
} // namespace mcpchain
