//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.cpp
// Purpose: Stream server loop: framing, delivery through the endpoint, ordered writes
//==========================================================================================================

#include "mcpchain/StdioServer.hpp"
#include "mcpchain/JsonRpcEndpoint.h"
#include "logging/Logger.h"

#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace mcpchain {

class StdioServer::Impl {
public:
    Impl(std::shared_ptr<const Chain> chain, Framing framing, std::istream& in, std::ostream& out)
        : endpoint(std::move(chain)), framing(framing), framer(MakeFramer(framing)), in(in), out(out) {}

    JsonRpcEndpoint endpoint;
    Framing framing;
    std::unique_ptr<IContentFramer> framer;
    std::istream& in;
    std::ostream& out;
    std::mutex writeMutex;
    std::string sessionId{GenerateTraceId()};

    bool writeFrame(const std::string& payload) {
        std::lock_guard<std::mutex> lock(writeMutex);
        out << framer->encode(payload);
        out.flush();
        if (!out.good()) {
            LOG_ERROR("StdioServer: write failed");
            return false;
        }
        return true;
    }

    //======================================================================================================
    // Reads the next payload. Returns std::nullopt at end of input; malformed frames are skipped.
    //======================================================================================================
    std::optional<std::string> readPayload() {
        std::string buffer;
        std::string line;
        while (std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (framing == Framing::Newline) {
                buffer = line + "\n";
                auto r = framer->tryDecodeEx(buffer);
                if (r.status == IContentFramer::DecodeStatus::Ok) {
                    return r.payload;
                }
                if (r.status == IContentFramer::DecodeStatus::BodyTooLarge) {
                    LOG_WARN("StdioServer: dropping oversized line");
                }
                continue;
            }

            // Content-Length: accumulate header lines (LF-only peers accepted) up to the blank line.
            if (line.empty() && buffer.empty()) {
                continue;
            }
            buffer += line;
            buffer += "\r\n";
            if (!line.empty()) {
                continue;
            }
            auto header = framer->tryDecodeEx(buffer);
            if (header.status == IContentFramer::DecodeStatus::InvalidHeader ||
                header.status == IContentFramer::DecodeStatus::BodyTooLarge) {
                LOG_WARN("StdioServer: dropping frame with bad header");
                if (header.status == IContentFramer::DecodeStatus::BodyTooLarge) {
                    return std::nullopt;
                }
                buffer.clear();
                continue;
            }
            if (header.status == IContentFramer::DecodeStatus::Incomplete && header.frameSize > buffer.size()) {
                const std::size_t have = buffer.size();
                buffer.resize(header.frameSize);
                in.read(&buffer[have], static_cast<std::streamsize>(header.frameSize - have));
                if (static_cast<std::size_t>(in.gcount()) != header.frameSize - have) {
                    LOG_WARN("StdioServer: unexpected end of input inside a frame body");
                    return std::nullopt;
                }
            }
            auto payload = framer->tryDecode(buffer);
            if (payload.has_value()) {
                return payload;
            }
            buffer.clear();
        }
        return std::nullopt;
    }
};

StdioServer::StdioServer(std::shared_ptr<const Chain> chain, Framing framing, std::istream& in, std::ostream& out)
    : pImpl(std::make_unique<Impl>(std::move(chain), framing, in, out)) {}

StdioServer::~StdioServer() = default;

void StdioServer::SetMaxMessageLength(std::size_t maxBytes) {
    pImpl->framer = MakeFramer(pImpl->framing, maxBytes);
}

std::size_t StdioServer::Run(std::stop_token st) {
    LOG_INFO("StdioServer: serving ({} framing)", ToString(pImpl->framing));
    std::size_t processed = 0;
    while (!st.stop_requested()) {
        auto payload = pImpl->readPayload();
        if (!payload.has_value()) {
            break;
        }
        ++processed;

        JsonRpcEndpoint::Session session;
        session.sessionId = pImpl->sessionId;
        auto stream = std::make_shared<CallbackOutputStream>(
            [this](const std::string& frame) { return pImpl->writeFrame(frame); });
        session.stream = stream;

        auto reply = pImpl->endpoint.Deliver(payload.value(), session);
        // Late writes from this traversal must not interleave with later replies.
        stream->Close();
        if (reply.has_value() && !pImpl->writeFrame(reply.value())) {
            break;
        }
    }
    LOG_INFO("StdioServer: stopped after {} message(s)", processed);
    return processed;
}

} // namespace mcpchain
