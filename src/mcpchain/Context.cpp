//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Context.cpp
// Purpose: Output stream implementations and RequestContext helpers
//==========================================================================================================

#include "mcpchain/Context.h"
#include "mcpchain/Protocol.h"
#include "mcpchain/JsonAccess.h"
#include "logging/Logger.h"

#include <cmath>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>

namespace mcpchain {

////////////////////////////////////////// BufferedOutputStream //////////////////////////////////////////
bool BufferedOutputStream::Write(const JSONRPCMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }
    frames_.push_back(message.Serialize());
    return true;
}

void BufferedOutputStream::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool BufferedOutputStream::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::vector<std::string> BufferedOutputStream::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.swap(frames_);
    return out;
}

////////////////////////////////////////// CallbackOutputStream //////////////////////////////////////////
CallbackOutputStream::CallbackOutputStream(Sink sink) : sink_(std::move(sink)) {}

bool CallbackOutputStream::Write(const JSONRPCMessage& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ || !sink_) {
        return false;
    }
    if (!sink_(message.Serialize())) {
        // A failed sink means the peer is gone; stop accepting writes for this traversal.
        closed_ = true;
        return false;
    }
    return true;
}

void CallbackOutputStream::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool CallbackOutputStream::IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

////////////////////////////////////////// RequestContext //////////////////////////////////////////
RequestContext::RequestContext(Fields fields) : fields_(std::move(fields)) {
    if (fields_.progressToken.has_value()) {
        progress_ = std::make_shared<ProgressState>();
    }
}

bool RequestContext::Notify(const JSONRPCNotification& notification) const {
    if (!fields_.stream) {
        return false;
    }
    if (!fields_.stream->Write(notification)) {
        LOG_DEBUG("Context stream rejected '{}' (trace={})", notification.method, fields_.traceId);
        return false;
    }
    return true;
}

bool RequestContext::SendRequest(const JSONRPCRequest& request) const {
    if (!fields_.stream) {
        return false;
    }
    return fields_.stream->Write(request);
}

bool RequestContext::ReportProgress(double progress, std::optional<double> total,
                                    const std::optional<std::string>& message) const {
    if (!progress_) {
        return false;
    }
    // Held across the write so concurrent nested calls emit in increasing order.
    std::lock_guard<std::mutex> lock(progress_->mutex);
    if (progress_->last.has_value() && !(progress > progress_->last.value())) {
        LOG_DEBUG("Dropping progress {} at or below {} (trace={})", progress, progress_->last.value(),
                  fields_.traceId);
        return false;
    }
    return emitProgressLocked(*progress_, progress, total, message);
}

bool RequestContext::AdvanceProgress(const std::optional<std::string>& message) const {
    if (!progress_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(progress_->mutex);
    const double next = progress_->last.has_value() ? std::floor(progress_->last.value()) + 1.0 : 1.0;
    return emitProgressLocked(*progress_, next, std::nullopt, message);
}

bool RequestContext::emitProgressLocked(ProgressState& state, double progress, std::optional<double> total,
                                        const std::optional<std::string>& message) const {
    JSONValue::Object p;
    json::set(p, "progressToken", fields_.progressToken.value());
    json::set(p, "progress", JSONValue{progress});
    if (total.has_value()) {
        json::set(p, "total", JSONValue{total.value()});
    }
    if (message.has_value()) {
        json::set(p, "message", JSONValue{message.value()});
    }
    if (!Notify(JSONRPCNotification(Methods::Progress, JSONValue{std::move(p)}))) {
        return false;
    }
    state.last = progress;
    return true;
}

std::string GenerateTraceId() {
    thread_local boost::uuids::random_generator gen;
    const boost::uuids::uuid u = gen();
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(32);
    for (auto b : u) {
        out.push_back(hex[(b >> 4) & 0x0F]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

} // namespace mcpchain
