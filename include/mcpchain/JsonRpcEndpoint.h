//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcEndpoint.h
// Purpose: Transport adapter core: raw JSON-RPC text in, raw JSON-RPC text out, through a chain head
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcpchain/Chain.h"
#include "mcpchain/Context.h"
#include "mcpchain/JsonRpcMessageRouter.h"

namespace mcpchain {

//==========================================================================================================
// JsonRpcEndpoint
// Purpose: Decodes wire messages, creates one RequestContext per inbound message, feeds the chain head
//          and encodes the outcome. Shared by the stdio and HTTP servers.
// Notes:
//   - Malformed JSON -> ParseError (-32700) with a null id.
//   - Non-conforming messages -> InvalidRequest (-32600).
//   - Batches (arrays) are answered with an array of responses; a batch yielding none produces no output.
//   - No exception escapes Deliver().
//==========================================================================================================
class JsonRpcEndpoint {
public:
    //==========================================================================================================
    // Session
    // Purpose: Transport-provided data copied into every context created for a delivered message.
    //==========================================================================================================
    struct Session {
        std::string sessionId;
        std::optional<std::string> authToken;
        std::optional<JSONValue> authData;
        std::shared_ptr<IOutputStream> stream;
    };

    explicit JsonRpcEndpoint(std::shared_ptr<const Chain> chain);

    //==========================================================================================================
    // Delivers one wire message (single message or batch).
    // Args:
    //   raw: JSON text.
    //   session: Transport session data for the contexts of this delivery.
    // Returns:
    //   Serialized response (or batch of responses); std::nullopt when nothing must be sent back.
    //==========================================================================================================
    std::optional<std::string> Deliver(const std::string& raw, const Session& session);
    std::optional<std::string> Deliver(const std::string& raw);

    const std::shared_ptr<const Chain>& GetChain() const { return chain_; }

private:
    std::optional<JSONRPCResponse> deliverOne(const JSONValue& message, const Session& session);
    RequestContext makeContext(const Session& session, const std::optional<JSONValue>& params) const;

    std::shared_ptr<const Chain> chain_;
    std::unique_ptr<IJsonRpcMessageRouter> router_;
};

} // namespace mcpchain
