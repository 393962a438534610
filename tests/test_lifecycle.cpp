//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_lifecycle.cpp
// Purpose: initialize/ping handling, session records and server-to-client pings
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "mcpchain/Chain.h"
#include "mcpchain/JsonAccess.h"
#include "mcpchain/JsonRpcEndpoint.h"
#include "mcpchain/errors/Errors.h"
#include "mcpchain/handlers/LifecycleHandler.hpp"
#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/version.h"

namespace mcpchain {

namespace {

struct Fixture {
    std::shared_ptr<handlers::LifecycleHandler> lifecycle = std::make_shared<handlers::LifecycleHandler>();
    std::shared_ptr<const Chain> chain;

    Fixture() {
        ChainBuilder b;
        b.Add(lifecycle).Add(std::make_shared<handlers::MathTools>());
        chain = b.Build();
    }
};

JsonRpcEndpoint::Session sessionNamed(const std::string& id) {
    JsonRpcEndpoint::Session s;
    s.sessionId = id;
    return s;
}

} // namespace

TEST(Lifecycle, InitializeAnswersServerInfo) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    auto reply = endpoint.Deliver(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test-client","version":"9.9"}}})",
        sessionNamed("s1"));
    ASSERT_TRUE(reply.has_value());
    auto v = ParseJSON(reply.value());
    const JSONValue* result = json::member(v, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(json::getString(*result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    const JSONValue* info = json::member(*result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(json::getString(*info, "name").value_or(""), SERVER_NAME);
    EXPECT_EQ(json::getString(*info, "version").value_or(""), getVersionString());
    const JSONValue* caps = json::member(*result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(json::member(*caps, "tools"), nullptr);

    auto state = fx.lifecycle->GetSession("s1");
    ASSERT_TRUE(state.has_value());
    EXPECT_FALSE(state->initialized);
    ASSERT_TRUE(state->clientInfo.has_value());
    EXPECT_EQ(state->clientInfo->name, "test-client");
    EXPECT_FALSE(fx.lifecycle->GetSession("other").has_value());
}

TEST(Lifecycle, InitializedNotificationMarksTheSession) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    ASSERT_TRUE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})", sessionNamed("s2")).has_value());
    auto none = endpoint.Deliver(R"({"jsonrpc":"2.0","method":"notifications/initialized"})", sessionNamed("s2"));
    EXPECT_FALSE(none.has_value());
    auto state = fx.lifecycle->GetSession("s2");
    ASSERT_TRUE(state.has_value());
    EXPECT_TRUE(state->initialized);
    EXPECT_EQ(state->protocolVersion, PROTOCOL_VERSION);
}

TEST(Lifecycle, PingReturnsEmptyObject) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    auto reply = endpoint.Deliver(R"({"jsonrpc":"2.0","id":"p","method":"ping"})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply.value(), R"({"id":"p","jsonrpc":"2.0","result":{}})");
}

TEST(Lifecycle, ToolTrafficIsForwarded) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    auto reply = endpoint.Deliver(
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"square_root","arguments":{"value":9}}})");
    ASSERT_TRUE(reply.has_value());
    const JSONValue v = ParseJSON(reply.value());
    const JSONValue* result = json::member(v, "result");
    ASSERT_NE(result, nullptr);
    EXPECT_EQ(json::getNumber(*json::member(*result, "structuredContent"), "value").value_or(0), 3.0);
}

TEST(Lifecycle, PingClientRoundTrip) {
    Fixture fx;
    auto stream = std::make_shared<BufferedOutputStream>();
    RequestContext::Fields f;
    f.stream = stream;
    const RequestContext ctx(f);

    std::optional<std::string> repliedId;
    auto id = fx.lifecycle->PingClient(ctx, [&](const JSONRPCResponse& r) { repliedId = IdToString(r.id); });
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(IdToString(id.value()), "lifecycle/out#1");
    EXPECT_EQ(fx.lifecycle->PendingClientRequests(), 1u);

    auto frames = stream->Drain();
    ASSERT_EQ(frames.size(), 1u);
    auto sent = ParseJSON(frames[0]);
    EXPECT_EQ(json::getString(sent, "method").value_or(""), "ping");
    EXPECT_EQ(json::getString(sent, "id").value_or(""), "lifecycle/out#1");

    // The client's reply enters through the chain head like any other message.
    JsonRpcEndpoint endpoint(fx.chain);
    EXPECT_FALSE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":"lifecycle/out#1","result":{}})").has_value());
    EXPECT_EQ(repliedId.value_or(""), "lifecycle/out#1");
    EXPECT_EQ(fx.lifecycle->PendingClientRequests(), 0u);
}

TEST(Lifecycle, PingClientNeedsAnOpenStream) {
    Fixture fx;
    EXPECT_FALSE(fx.lifecycle->PingClient(RequestContext{}, [](const JSONRPCResponse&) {}).has_value());

    auto stream = std::make_shared<BufferedOutputStream>();
    stream->Close();
    RequestContext::Fields f;
    f.stream = stream;
    EXPECT_FALSE(fx.lifecycle->PingClient(RequestContext(f), [](const JSONRPCResponse&) {}).has_value());
    EXPECT_EQ(fx.lifecycle->PendingClientRequests(), 0u);
}

TEST(Lifecycle, UnmatchedResponsesAreForwarded) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    EXPECT_FALSE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":"unknown/out#5","result":{}})").has_value());
    EXPECT_EQ(fx.lifecycle->PendingClientRequests(), 0u);
}

TEST(Lifecycle, ToolsListWithoutProvidersIsEmpty) {
    ChainBuilder b;
    b.Add(std::make_shared<handlers::LifecycleHandler>());
    JsonRpcEndpoint endpoint(b.Build());
    auto reply = endpoint.Deliver(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply.value(), R"({"id":1,"jsonrpc":"2.0","result":{"tools":[]}})");
}

TEST(Lifecycle, InitializedWithoutInitializeKeepsNoRecord) {
    Fixture fx;
    JsonRpcEndpoint endpoint(fx.chain);
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(endpoint.Deliver(R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                                      sessionNamed("drive-by-" + std::to_string(i))).has_value());
    }
    EXPECT_EQ(fx.lifecycle->SessionCount(), 0u);
}

TEST(Lifecycle, SessionRecordsAreCapped) {
    handlers::LifecycleLimits limits;
    limits.maxSessions = 3;
    auto lifecycle = std::make_shared<handlers::LifecycleHandler>(Implementation{"capped", "1"}, limits);
    ChainBuilder b;
    b.Add(lifecycle);
    JsonRpcEndpoint endpoint(b.Build());

    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})",
                                     sessionNamed("s" + std::to_string(i))).has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(lifecycle->SessionCount(), 3u);
    // The most recent sessions survive.
    EXPECT_TRUE(lifecycle->GetSession("s49").has_value());
    EXPECT_TRUE(lifecycle->GetSession("s47").has_value());
    EXPECT_FALSE(lifecycle->GetSession("s0").has_value());
}

TEST(Lifecycle, IdleSessionsExpire) {
    handlers::LifecycleLimits limits;
    limits.sessionIdleTimeout = std::chrono::milliseconds(20);
    auto lifecycle = std::make_shared<handlers::LifecycleHandler>(Implementation{"idle", "1"}, limits);
    ChainBuilder b;
    b.Add(lifecycle);
    JsonRpcEndpoint endpoint(b.Build());

    ASSERT_TRUE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})",
                                 sessionNamed("old")).has_value());
    EXPECT_TRUE(lifecycle->GetSession("old").has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_FALSE(lifecycle->GetSession("old").has_value());

    ASSERT_TRUE(endpoint.Deliver(R"({"jsonrpc":"2.0","id":2,"method":"initialize","params":{}})",
                                 sessionNamed("new")).has_value());
    EXPECT_EQ(lifecycle->SessionCount(), 1u);
}

TEST(Lifecycle, ZeroSessionCapIsRejected) {
    handlers::LifecycleLimits limits;
    limits.maxSessions = 0;
    EXPECT_THROW({ handlers::LifecycleHandler h(Implementation{"x", "1"}, limits); }, std::invalid_argument);
}

TEST(Lifecycle, UnansweredClientPingsAreBounded) {
    handlers::LifecycleLimits limits;
    limits.clientRequests.maxPending = 2;
    limits.clientRequests.replyTimeout = std::chrono::milliseconds(0);
    handlers::LifecycleHandler lifecycle(Implementation{"bounded", "1"}, limits);

    auto stream = std::make_shared<BufferedOutputStream>();
    RequestContext::Fields f;
    f.stream = stream;
    const RequestContext ctx(f);

    EXPECT_TRUE(lifecycle.PingClient(ctx, nullptr).has_value());
    EXPECT_TRUE(lifecycle.PingClient(ctx, nullptr).has_value());
    EXPECT_FALSE(lifecycle.PingClient(ctx, nullptr).has_value());
    EXPECT_EQ(lifecycle.PendingClientRequests(), 2u);
    EXPECT_EQ(stream->Drain().size(), 2u);
}

TEST(Lifecycle, ClientPingTimesOutWithAnError) {
    handlers::LifecycleLimits limits;
    limits.clientRequests.replyTimeout = std::chrono::milliseconds(10);
    handlers::LifecycleHandler lifecycle(Implementation{"timeout", "1"}, limits);

    auto stream = std::make_shared<BufferedOutputStream>();
    RequestContext::Fields f;
    f.stream = stream;
    const RequestContext ctx(f);

    std::optional<JSONRPCResponse> reply;
    auto id = lifecycle.PingClient(ctx, [&](const JSONRPCResponse& r) { reply = r; });
    ASSERT_TRUE(id.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(40));

    // The next send sweeps the stale request.
    EXPECT_TRUE(lifecycle.PingClient(ctx, [](const JSONRPCResponse&) {}).has_value());
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->IsError());
    EXPECT_EQ(IdToString(reply->id), IdToString(id.value()));
    auto err = errors::mcpErrorFromResponse(reply.value());
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(lifecycle.PendingClientRequests(), 1u);
}

} // namespace mcpchain
