//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.hpp
// Purpose: Serves a composed chain over a byte stream pair (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <stop_token>

#include "mcpchain/Chain.h"
#include "mcpchain/ContentFramer.h"

namespace mcpchain {

//==========================================================================================================
// StdioServer
// Purpose: Reads framed JSON-RPC messages, delivers them through a JsonRpcEndpoint and writes the replies.
// Notes:
//   - Messages are processed in arrival order; notifications a traversal writes to its context stream
//     are written before that traversal's response.
//   - Logging should go to stderr while serving (Logger::setForceStderr) so stdout carries only frames.
//==========================================================================================================
class StdioServer {
public:
    StdioServer(std::shared_ptr<const Chain> chain, Framing framing, std::istream& in, std::ostream& out);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    //==========================================================================================================
    // Serves until end of input or until stop is requested (checked between messages).
    // Args:
    //   st: Stop token.
    // Returns:
    //   Number of frames processed.
    //==========================================================================================================
    std::size_t Run(std::stop_token st = {});

    void SetMaxMessageLength(std::size_t maxBytes);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpchain
