//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpchain/HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "mcpchain/HTTPServer.hpp"
#include "mcpchain/JsonRpcEndpoint.h"

#include <openssl/ssl.h>

namespace mcpchain {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

void trim(std::string& s) {
    auto notSpace = [](unsigned char c){ return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

// "Bearer <token>" (scheme case-insensitive) -> token
std::optional<std::string> bearerToken(const std::string& header) {
    static const std::string scheme = "bearer ";
    if (header.size() <= scheme.size()) return std::nullopt;
    for (std::size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(header[i])) != scheme[i]) return std::nullopt;
    }
    std::string token = header.substr(scheme.size());
    trim(token);
    if (token.empty()) return std::nullopt;
    return token;
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    JsonRpcEndpoint endpoint;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    uint16_t boundPort{0};

    HTTPServer::ErrorHandler errorHandler;

    Impl(std::shared_ptr<const Chain> chain, const HTTPServer::Options& o)
        : opts(o), endpoint(std::move(chain)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        } else if (opts.scheme != "http") {
            throw std::invalid_argument("HTTPServer: unsupported scheme '" + opts.scheme + "'");
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        if (opts.port.empty()) {
            throw std::runtime_error("HTTPServer invalid port: empty");
        }
        bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
        if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
            throw std::runtime_error("HTTPServer invalid port: " + opts.port);
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort = acceptor->local_endpoint().port();
    }

    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        auto res = makeResponse(req);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    void reportSessionError(const char* kind, const std::exception& e) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} session suppressed during shutdown: {}", kind, e.what());
#endif
            return;
        }
        setError(std::string("HTTPServer ") + kind + " session error: " + e.what());
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream); // close after single request
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            reportSessionError("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls); // close after single request
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            reportSessionError("TLS", e);
        }
        co_return;
    }

    JsonRpcEndpoint::Session makeSession(const http::request<http::string_body>& req) const {
        JsonRpcEndpoint::Session session;
        auto sid = req.find("Mcp-Session-Id");
        if (sid != req.end()) {
            session.sessionId = std::string(sid->value());
        }
        auto auth = req.find(http::field::authorization);
        if (auth != req.end()) {
            session.authToken = bearerToken(std::string(auth->value()));
        }
        return session;
    }

    http::response<http::string_body> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.keep_alive(false);

        std::string target = std::string(req.target());
        auto q = target.find('?');
        if (q != std::string::npos) target.erase(q);
        if (target != opts.path) {
            res.result(http::status::not_found);
            res.set(http::field::content_type, "application/json");
            res.body() = std::string("{\"error\":\"Not found\"}");
            res.prepare_payload();
            return res;
        }
        if (req.method() != http::verb::post) {
            res.result(http::status::method_not_allowed);
            res.set(http::field::allow, "POST");
            res.set(http::field::content_type, "application/json");
            res.body() = std::string("{\"error\":\"POST required\"}");
            res.prepare_payload();
            return res;
        }

        JsonRpcEndpoint::Session session = makeSession(req);
        auto stream = std::make_shared<BufferedOutputStream>();
        session.stream = stream;
        if (!session.sessionId.empty()) {
            res.set("Mcp-Session-Id", session.sessionId);
        }

        auto reply = endpoint.Deliver(req.body(), session);
        stream->Close();
        auto frames = stream->Drain();

        if (!reply.has_value()) {
            if (!frames.empty()) {
                LOG_DEBUG("HTTPServer: dropping {} streamed message(s) of a delivery without response", frames.size());
            }
            res.result(http::status::accepted);
            res.prepare_payload();
            return res;
        }

        if (frames.empty()) {
            res.set(http::field::content_type, "application/json");
            res.body() = std::move(reply.value());
            res.prepare_payload();
            return res;
        }

        std::string body;
        for (const auto& frame : frames) {
            body += "event: message\ndata: " + frame + "\n\n";
        }
        body += "event: message\ndata: " + reply.value() + "\n\n";
        res.set(http::field::content_type, "text/event-stream");
        res.set(http::field::cache_control, "no-cache");
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // Suppress shutdown-related errors (e.g., operation_aborted when acceptor is closed)
#ifdef _DEBUG
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
#endif
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(std::shared_ptr<const Chain> chain, const Options& opts)
    : pImpl(std::make_unique<Impl>(std::move(chain), opts)) {}

HTTPServer::~HTTPServer() {
    if (pImpl->running.load()) {
        Stop().get();
    }
}

std::future<void> HTTPServer::Start() {
    pImpl->bind();
    LOG_INFO("HTTPServer: listening on {}://{}:{}{}", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort, pImpl->opts.path);

    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTPServer I/O thread error: ") + e.what());
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec;
        pImpl->acceptor->close(ec);
        if (ec) {
            LOG_DEBUG("HTTPServer: acceptor close: {}", ec.message());
        }
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

uint16_t HTTPServer::BoundPort() const {
    return pImpl->boundPort;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

HTTPServer::Options ParseListenUrl(const std::string& url) {
    HTTPServer::Options opts;

    std::string cfg = url;
    trim(cfg);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Path component (defaults to /mcp)
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) opts.path = path;
    }
    trim(hostPort);

    // Parse host[:port] including IPv4/IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8080";
    }

    // Parse query parameters: cert, key
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

} // namespace mcpchain
