//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Chain.cpp
// Purpose: Chain traversal (Downstream continuation, terminal sentinel) and chain composition
//==========================================================================================================

#include "mcpchain/Chain.h"
#include "mcpchain/Protocol.h"
#include "mcpchain/JsonAccess.h"
#include "logging/Logger.h"

#include <algorithm>
#include <map>
#include <set>

namespace mcpchain {

namespace {

//==========================================================================================================
// Terminal sentinel for requests: MethodNotFound naming the method (and, for tools/call, the tool).
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> terminalResponse(const JSONRPCRequest& request) {
    JSONValue::Object data;
    json::set(data, "method", JSONValue{request.method});
    std::string message = "Method not found: " + request.method;
    if (request.method == Methods::CallTool && request.params.has_value()) {
        auto tool = json::getString(request.params.value(), "name");
        if (tool.has_value()) {
            message = "Method not found: " + request.method + " (no handler provides tool '" + tool.value() + "')";
            json::set(data, "tool", JSONValue{tool.value()});
        }
    }
    return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound, message, JSONValue{std::move(data)});
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::string();
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

} // namespace

////////////////////////////////////////////// Downstream //////////////////////////////////////////////
bool Downstream::AtEnd() const {
    return chain_ == nullptr || position_ >= chain_->Size();
}

std::unique_ptr<JSONRPCResponse> Downstream::HandleRequest(const RequestContext& ctx,
                                                           const JSONRPCRequest& request) const {
    if (AtEnd()) {
        LOG_DEBUG("No handler for '{}' (id={}, trace={})", request.method, IdToString(request.id), ctx.TraceId());
        return terminalResponse(request);
    }
    const auto& handler = chain_->At(position_);
    const Downstream next(chain_, position_ + 1);
    std::unique_ptr<JSONRPCResponse> response;
    try {
        response = handler->HandleRequest(ctx, request, next);
    } catch (const errors::DownstreamCallError& e) {
        return errors::makeErrorResponse(request.id, e.error());
    } catch (const std::exception& e) {
        LOG_ERROR("Handler '{}' threw while handling '{}' (trace={}): {}",
                  handler->GetName(), request.method, ctx.TraceId(), e.what());
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                   "Internal error: handler '" + handler->GetName() + "' failed: " + e.what());
    }
    if (!response) {
        LOG_ERROR("Handler '{}' returned no response for '{}'", handler->GetName(), request.method);
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError,
                                   "Internal error: handler '" + handler->GetName() + "' returned no response");
    }
    if (response->id != request.id) {
        LOG_WARN("Handler '{}' answered id={} for request id={}; restoring request id",
                 handler->GetName(), IdToString(response->id), IdToString(request.id));
        response->id = request.id;
    }
    return response;
}

void Downstream::HandleNotification(const RequestContext& ctx, const JSONRPCNotification& notification) const {
    if (AtEnd()) {
        LOG_DEBUG("Notification '{}' reached the end of the chain (trace={})", notification.method, ctx.TraceId());
        return;
    }
    const auto& handler = chain_->At(position_);
    try {
        handler->HandleNotification(ctx, notification, Downstream(chain_, position_ + 1));
    } catch (const std::exception& e) {
        LOG_ERROR("Handler '{}' threw while handling notification '{}': {}",
                  handler->GetName(), notification.method, e.what());
    }
}

void Downstream::HandleResponse(const RequestContext& ctx, const JSONRPCResponse& response) const {
    if (AtEnd()) {
        LOG_WARN("Unmatched response id={} reached the end of the chain (trace={})",
                 IdToString(response.id), ctx.TraceId());
        return;
    }
    const auto& handler = chain_->At(position_);
    try {
        handler->HandleResponse(ctx, response, Downstream(chain_, position_ + 1));
    } catch (const std::exception& e) {
        LOG_ERROR("Handler '{}' threw while handling response id={}: {}",
                  handler->GetName(), IdToString(response.id), e.what());
    }
}

//////////////////////////////////////////////// Chain ////////////////////////////////////////////////
std::vector<std::string> Chain::Names() const {
    std::vector<std::string> out;
    out.reserve(handlers_.size());
    for (const auto& h : handlers_) {
        out.push_back(h->GetName());
    }
    return out;
}

std::unique_ptr<JSONRPCResponse> Chain::HandleRequest(const RequestContext& ctx, const JSONRPCRequest& request) const {
    return Head().HandleRequest(ctx, request);
}

void Chain::HandleNotification(const RequestContext& ctx, const JSONRPCNotification& notification) const {
    Head().HandleNotification(ctx, notification);
}

void Chain::HandleResponse(const RequestContext& ctx, const JSONRPCResponse& response) const {
    Head().HandleResponse(ctx, response);
}

///////////////////////////////////////////// ChainBuilder /////////////////////////////////////////////
ChainBuilder& ChainBuilder::Add(std::shared_ptr<IHandler> handler) {
    handlers_.push_back(std::move(handler));
    return *this;
}

ChainBuilder& ChainBuilder::AddAlias(const std::string& alias) {
    if (!registry_) {
        throw errors::ChainCompositionError("Cannot resolve alias '" + alias + "': no handler registry configured");
    }
    auto handler = registry_->Create(alias);
    if (!handler) {
        std::string known;
        for (const auto& a : registry_->Aliases()) {
            if (!known.empty()) known += ", ";
            known += a;
        }
        throw errors::ChainCompositionError("Unknown handler alias '" + alias + "' (known: " + known + ")");
    }
    handlers_.push_back(std::move(handler));
    return *this;
}

ChainBuilder& ChainBuilder::FromAliasList(const std::string& aliases) {
    std::size_t start = 0;
    while (start <= aliases.size()) {
        std::size_t comma = aliases.find(',', start);
        if (comma == std::string::npos) comma = aliases.size();
        const std::string alias = trim(aliases.substr(start, comma - start));
        if (!alias.empty()) {
            AddAlias(alias);
        }
        start = comma + 1;
    }
    return *this;
}

std::vector<std::string> ChainBuilder::Diagnose() const {
    std::vector<std::string> findings;

    // tool -> positions providing it
    std::map<std::string, std::vector<std::size_t>> providers;
    for (std::size_t i = 0; i < handlers_.size(); ++i) {
        if (!handlers_[i]) continue;
        for (const auto& tool : handlers_[i]->GetProvidedTools()) {
            providers[tool].push_back(i);
        }
    }

    for (std::size_t i = 0; i < handlers_.size(); ++i) {
        if (!handlers_[i]) continue;
        const std::string caller = handlers_[i]->GetName();
        for (const auto& tool : handlers_[i]->GetRequiredTools()) {
            auto it = providers.find(tool);
            const bool after = it != providers.end() &&
                std::any_of(it->second.begin(), it->second.end(), [i](std::size_t p) { return p > i; });
            if (after) continue;
            if (it != providers.end() && !it->second.empty()) {
                const std::size_t p = it->second.front();
                findings.push_back(fmt::format(
                    "Handler '{}' (position {}) requires tool '{}', which is provided by '{}' at position {}; "
                    "compose '{}' after '{}'",
                    caller, i, tool, handlers_[p]->GetName(), p, handlers_[p]->GetName(), caller));
            } else {
                findings.push_back(fmt::format(
                    "Handler '{}' (position {}) requires tool '{}', which no handler after it provides",
                    caller, i, tool));
            }
        }
    }

    for (const auto& [tool, positions] : providers) {
        if (positions.size() < 2) continue;
        std::string who;
        for (std::size_t p : positions) {
            if (!who.empty()) who += ", ";
            who += fmt::format("'{}' (position {})", handlers_[p]->GetName(), p);
        }
        findings.push_back(fmt::format(
            "Tool '{}' is provided by {}; tools/list will contain it more than once", tool, who));
    }
    return findings;
}

std::shared_ptr<const Chain> ChainBuilder::Build() const {
    if (handlers_.empty()) {
        throw errors::ChainCompositionError("Cannot compose an empty chain");
    }
    std::set<const IHandler*> seen;
    for (std::size_t i = 0; i < handlers_.size(); ++i) {
        if (!handlers_[i]) {
            throw errors::ChainCompositionError(fmt::format("Handler at position {} is null", i));
        }
        if (!seen.insert(handlers_[i].get()).second) {
            throw errors::ChainCompositionError(fmt::format(
                "Handler instance '{}' appears more than once (position {}); a chain must be acyclic",
                handlers_[i]->GetName(), i));
        }
    }

    const auto findings = Diagnose();
    if (!findings.empty()) {
        if (mode_ == validation::ValidationMode::Strict) {
            std::string joined;
            for (const auto& f : findings) {
                if (!joined.empty()) joined += "; ";
                joined += f;
            }
            throw errors::ChainCompositionError("Chain composition check failed: " + joined);
        }
        for (const auto& f : findings) {
            LOG_WARN("Chain composition: {}", f);
        }
    }

    std::shared_ptr<const Chain> chain(new Chain(handlers_));
    std::string names;
    for (const auto& n : chain->Names()) {
        if (!names.empty()) names += " -> ";
        names += n;
    }
    LOG_INFO("Composed chain of {} handler(s): {}", chain->Size(), names);
    return chain;
}

} // namespace mcpchain
