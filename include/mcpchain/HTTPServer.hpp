//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpchain/Chain.h"

namespace mcpchain {

//==========================================================================================================
// HTTPServer
// Purpose: Serves a composed chain at a single JSON-RPC endpoint path (POST only).
// Behavior:
//   - Requests           -> 200 application/json with the response, or 200 text/event-stream when the
//                           traversal wrote notifications to its context stream (notifications first,
//                           response last).
//   - Notifications/replies -> 202 Accepted, empty body.
//   - Other methods -> 405, other paths -> 404.
//   - Mcp-Session-Id and Authorization: Bearer headers populate the request context.
//==========================================================================================================
class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint path, and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; "0" binds an ephemeral port (see BoundPort())
    //   path: JSON-RPC endpoint path
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8080"};
        std::string path{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    HTTPServer(std::shared_ptr<const Chain> chain, const Options& opts);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running. Throws std::runtime_error when the
    //   options are invalid or the address cannot be bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    // Port the listener is bound to (valid after Start()).
    uint16_t BoundPort() const;

    void SetErrorHandler(ErrorHandler handler);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ParseListenUrl
// Purpose: Builds server options from a listen URL:
//            - "http://<address>:<port>[/path]" (e.g., http://127.0.0.1:0/mcp)
//            - "https://<address>:<port>[/path]?cert=<pem>&key=<pem>"
//            - "[::1]:8080" style IPv6 literals are accepted
//          Unknown parameters are ignored. If scheme is omitted, defaults to http.
//==========================================================================================================
HTTPServer::Options ParseListenUrl(const std::string& url);

} // namespace mcpchain
