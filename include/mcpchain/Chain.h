//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Chain.h
// Purpose: Immutable handler chain and the builder that composes it
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mcpchain/Handler.h"
#include "mcpchain/HandlerRegistry.h"
#include "mcpchain/errors/Errors.h"
#include "mcpchain/validation/Validation.h"

namespace mcpchain {

//==========================================================================================================
// Chain
// Purpose: Finite, totally ordered, immutable sequence of handlers. The head is the entry point.
// Notes:
//   - Only ChainBuilder creates chains; membership and order never change afterwards.
//   - Safe to share across threads; all traversal state lives in RequestContext and the call stack.
//==========================================================================================================
class Chain {
public:
    std::size_t Size() const { return handlers_.size(); }
    const std::shared_ptr<IHandler>& At(std::size_t position) const { return handlers_.at(position); }
    std::vector<std::string> Names() const;

    // Continuation positioned at the head.
    Downstream Head() const { return Downstream(this, 0); }

    // Head entry points (the only operations a transport adapter needs).
    std::unique_ptr<JSONRPCResponse> HandleRequest(const RequestContext& ctx, const JSONRPCRequest& request) const;
    void HandleNotification(const RequestContext& ctx, const JSONRPCNotification& notification) const;
    void HandleResponse(const RequestContext& ctx, const JSONRPCResponse& response) const;

private:
    friend class ChainBuilder;
    explicit Chain(std::vector<std::shared_ptr<IHandler>> handlers) : handlers_(std::move(handlers)) {}

    const std::vector<std::shared_ptr<IHandler>> handlers_;
};

//==========================================================================================================
// ChainBuilder
// Purpose: Collects an ordered handler list and produces an immutable Chain.
// Notes:
//   - Structural errors (empty chain, null handler, same instance twice, unknown alias) always throw
//     errors::ChainCompositionError.
//   - Ordering findings (a required tool not provided after its requirer) and tool name collisions
//     are logged as warnings in ValidationMode::Off and thrown in ValidationMode::Strict.
//==========================================================================================================
class ChainBuilder {
public:
    ChainBuilder() = default;
    explicit ChainBuilder(std::shared_ptr<const HandlerRegistry> registry) : registry_(std::move(registry)) {}

    // Appends a handler instance at the next position.
    ChainBuilder& Add(std::shared_ptr<IHandler> handler);

    // Appends a fresh instance of a registered alias. Throws ChainCompositionError when unknown.
    ChainBuilder& AddAlias(const std::string& alias);

    // Appends every alias of a comma separated list ("lifecycle, stddev,variance"); blanks are skipped.
    ChainBuilder& FromAliasList(const std::string& aliases);

    ChainBuilder& SetValidationMode(validation::ValidationMode mode) { mode_ = mode; return *this; }

    // Ordering and collision findings for the handlers added so far (empty when none).
    std::vector<std::string> Diagnose() const;

    //==========================================================================================================
    // Composes the chain.
    // Returns:
    //   Shared immutable chain. Throws errors::ChainCompositionError on structural errors, or on
    //   diagnostic findings in Strict mode.
    //==========================================================================================================
    std::shared_ptr<const Chain> Build() const;

private:
    std::shared_ptr<const HandlerRegistry> registry_;
    std::vector<std::shared_ptr<IHandler>> handlers_;
    validation::ValidationMode mode_{validation::ValidationMode::Off};
};

} // namespace mcpchain
