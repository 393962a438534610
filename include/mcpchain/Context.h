//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Context.h
// Purpose: Per-traversal request context and the client output stream it may carry
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {

//==========================================================================================================
// IOutputStream
// Purpose: Client-facing stream for incremental output (messages written during a traversal).
// Notes:
//   - Owned by the transport adapter; shared with the context of one traversal.
//   - Once closed, Write() returns false and has no effect; closing never affects other traversals.
//==========================================================================================================
class IOutputStream {
public:
    virtual ~IOutputStream() = default;

    //==========================================================================================================
    // Writes one message (notification, or a server-to-client request) to the client.
    // Args:
    //   message: The message to deliver.
    // Returns:
    //   true when accepted; false when the stream is closed or the write failed.
    //==========================================================================================================
    virtual bool Write(const JSONRPCMessage& message) = 0;

    virtual void Close() = 0;
    virtual bool IsClosed() const = 0;
};

//==========================================================================================================
// BufferedOutputStream
// Purpose: Collects serialized messages in memory; the adapter drains them once the traversal ends.
//==========================================================================================================
class BufferedOutputStream : public IOutputStream {
public:
    bool Write(const JSONRPCMessage& message) override;
    void Close() override;
    bool IsClosed() const override;

    // Returns and clears the buffered frames in write order.
    std::vector<std::string> Drain();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> frames_;
    bool closed_{false};
};

//==========================================================================================================
// CallbackOutputStream
// Purpose: Forwards each serialized message to a sink immediately (stdio writer).
//==========================================================================================================
class CallbackOutputStream : public IOutputStream {
public:
    using Sink = std::function<bool(const std::string& frame)>;
    explicit CallbackOutputStream(Sink sink);

    bool Write(const JSONRPCMessage& message) override;
    void Close() override;
    bool IsClosed() const override;

private:
    mutable std::mutex mutex_;
    Sink sink_;
    bool closed_{false};
};

//==========================================================================================================
// RequestContext
// Purpose: Cross-cutting state of one traversal. Created once at the adapter boundary, then shared
//          read-only (const&) by every handler and nested call of that traversal.
// Fields:
//   traceId: Correlation id for logs (adapter generated).
//   sessionId: Transport session (e.g. Mcp-Session-Id header), empty when the transport has none.
//   authToken: Bearer credential from the transport, when present.
//   authData: Opaque authentication claims attached by the adapter.
//   progressToken: params._meta.progressToken of the client-facing request, when present.
//   stream: Optional client output stream.
// Notes:
//   - Copies share one progress record, so every level of a traversal reports against the same
//     strictly increasing sequence for the client's token.
//==========================================================================================================
class RequestContext {
public:
    struct Fields {
        std::string traceId;
        std::string sessionId;
        std::optional<std::string> authToken;
        std::optional<JSONValue> authData;
        std::optional<JSONValue> progressToken;
        std::shared_ptr<IOutputStream> stream;
    };

    RequestContext() = default;
    explicit RequestContext(Fields fields);

    const std::string& TraceId() const { return fields_.traceId; }
    const std::string& SessionId() const { return fields_.sessionId; }
    const std::optional<std::string>& AuthToken() const { return fields_.authToken; }
    const std::optional<JSONValue>& AuthData() const { return fields_.authData; }
    const std::optional<JSONValue>& ProgressToken() const { return fields_.progressToken; }
    bool HasStream() const { return fields_.stream != nullptr; }

    //==========================================================================================================
    // Writes a notification to the context stream.
    // Returns:
    //   false when the context carries no stream or the stream is closed.
    //==========================================================================================================
    bool Notify(const JSONRPCNotification& notification) const;

    // Writes a server-to-client request (its reply arrives later through HandleResponse).
    bool SendRequest(const JSONRPCRequest& request) const;

    //==========================================================================================================
    // Emits notifications/progress { progressToken, progress, total?, message? } when the request
    // carried a progress token.
    // Returns:
    //   false when nothing was written: no token, no open stream, or progress not above the last value
    //   reported in this traversal.
    //==========================================================================================================
    bool ReportProgress(double progress, std::optional<double> total = std::nullopt,
                        const std::optional<std::string>& message = std::nullopt) const;

    //==========================================================================================================
    // Reports the next whole step of the traversal (1, 2, 3, ... or the next integer above an explicit
    // ReportProgress value) without a total. Nested handlers use this since none of them knows how many
    // steps the levels above will add.
    //==========================================================================================================
    bool AdvanceProgress(const std::optional<std::string>& message = std::nullopt) const;

private:
    struct ProgressState {
        std::mutex mutex;
        std::optional<double> last;
    };

    bool emitProgressLocked(ProgressState& state, double progress, std::optional<double> total,
                            const std::optional<std::string>& message) const;

    Fields fields_;
    std::shared_ptr<ProgressState> progress_;
};

// Generates a random trace id (32 lowercase hex characters).
std::string GenerateTraceId();

} // namespace mcpchain
