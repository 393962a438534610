//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_composition.cpp
// Purpose: End-to-end pipelines over the wire: composed statistics, id pairing, progress and unknown methods
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "mcpchain/Chain.h"
#include "mcpchain/JsonRpcEndpoint.h"
#include "mcpchain/handlers/Catalog.hpp"
#include "mcpchain/typed/Content.h"

namespace mcpchain {

namespace {

std::shared_ptr<const Chain> build(const std::string& aliases) {
    return ChainBuilder(handlers::MakeBuiltinRegistry()).FromAliasList(aliases).Build();
}

JSONValue deliver(JsonRpcEndpoint& endpoint, const std::string& raw,
                  const JsonRpcEndpoint::Session& session = JsonRpcEndpoint::Session{}) {
    auto reply = endpoint.Deliver(raw, session);
    EXPECT_TRUE(reply.has_value());
    return reply.has_value() ? ParseJSON(reply.value()) : JSONValue{};
}

CallToolResult resultOf(const JSONValue& reply) {
    const JSONValue* result = json::member(reply, "result");
    EXPECT_NE(result, nullptr);
    if (!result) return CallToolResult{};
    auto decoded = CallToolResultFromValue(*result);
    EXPECT_TRUE(decoded.has_value());
    return decoded.value_or(CallToolResult{});
}

int errorCode(const JSONValue& reply) {
    const JSONValue* err = json::member(reply, "error");
    EXPECT_NE(err, nullptr);
    if (!err) return 0;
    return static_cast<int>(json::getNumber(*err, "code").value_or(0.0));
}

std::string errorMessage(const JSONValue& reply) {
    const JSONValue* err = json::member(reply, "error");
    return err ? json::getString(*err, "message").value_or("") : std::string();
}

bool isError(const JSONValue& reply) {
    return json::member(reply, "error") != nullptr;
}

// Progress values of the streamed frames, checking each frame is a progress notification for token.
std::vector<double> progressValues(const std::vector<std::string>& frames, const std::string& token) {
    std::vector<double> values;
    for (const auto& f : frames) {
        const JSONValue msg = ParseJSON(f);
        EXPECT_EQ(json::getString(msg, "method").value_or(""), "notifications/progress");
        const JSONValue* params = json::member(msg, "params");
        EXPECT_NE(params, nullptr);
        if (!params) continue;
        EXPECT_EQ(json::getString(*params, "progressToken").value_or(""), token);
        values.push_back(json::getNumber(*params, "progress").value_or(-1));
    }
    return values;
}

} // namespace

TEST(Composition, StddevOfSampleIsTwo) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[2,4,4,4,5,5,7,9]}}})");
    auto result = resultOf(reply);
    EXPECT_FALSE(result.isError);
    EXPECT_EQ(typed::firstText(result).value_or(""), "2");
    ASSERT_TRUE(result.structuredContent.has_value());
    EXPECT_EQ(json::getNumber(result.structuredContent.value(), "value").value_or(-1), 2.0);
    EXPECT_EQ(json::getNumber(reply, "id").value_or(0), 1.0);
}

TEST(Composition, VarianceAndMeanFromOnePipeline) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto variance = resultOf(deliver(endpoint,
        R"({"jsonrpc":"2.0","id":"v","method":"tools/call","params":{"name":"variance","arguments":{"numbers":[2,4,4,4,5,5,7,9]}}})"));
    EXPECT_EQ(typed::firstText(variance).value_or(""), "4");
    auto mean = resultOf(deliver(endpoint,
        R"({"jsonrpc":"2.0","id":"m","method":"tools/call","params":{"name":"mean","arguments":{"numbers":[1,2]}}})"));
    EXPECT_EQ(typed::firstText(mean).value_or(""), "1.5");
}

TEST(Composition, IdenticalAliasListsBehaveIdentically) {
    const std::string aliases = "lifecycle,stddev,variance,statistics,math";
    JsonRpcEndpoint a(build(aliases));
    JsonRpcEndpoint b(build(aliases));
    const std::string list = R"({"jsonrpc":"2.0","id":"l","method":"tools/list"})";
    const std::string call =
        R"({"jsonrpc":"2.0","id":"c","method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[1,2,3,4]}}})";
    EXPECT_EQ(a.Deliver(list), b.Deliver(list));
    EXPECT_EQ(a.Deliver(call), b.Deliver(call));
}

TEST(Composition, ResponsesCarryTheRequestId) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":"abc-123","method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[1,1]}}})");
    EXPECT_EQ(json::getString(reply, "id").value_or(""), "abc-123");

    reply = deliver(endpoint, R"({"jsonrpc":"2.0","id":"zz","method":"tools/frobnicate"})");
    EXPECT_EQ(json::getString(reply, "id").value_or(""), "zz");
}

TEST(Composition, UnknownMethodIsMethodNotFound) {
    JsonRpcEndpoint endpoint(build("lifecycle,statistics"));
    auto reply = deliver(endpoint, R"({"jsonrpc":"2.0","id":9,"method":"tools/frobnicate"})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(errorMessage(reply), "Method not found: tools/frobnicate");
}

TEST(Composition, UnknownToolNamesTheTool) {
    JsonRpcEndpoint endpoint(build("lifecycle,statistics"));
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"nope","arguments":{}}})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_NE(errorMessage(reply).find("no handler provides tool 'nope'"), std::string::npos);
}

TEST(Composition, MisorderedPipelineExplainsTheFix) {
    JsonRpcEndpoint endpoint(build("statistics,variance"));
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"variance","arguments":{"numbers":[1,2,3]}}})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::DownstreamToolMissing);
    EXPECT_NE(errorMessage(reply).find("Compose the handler that provides 'mean' after 'variance'"), std::string::npos);
}

TEST(Composition, DescribeCombinesConcurrentCalls) {
    JsonRpcEndpoint endpoint(build("describe,variance,statistics,math"));
    auto result = resultOf(deliver(endpoint,
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"describe","arguments":{"numbers":[4,1,3,2]}}})"));
    ASSERT_TRUE(result.structuredContent.has_value());
    const JSONValue& sc = result.structuredContent.value();
    EXPECT_EQ(json::getNumber(sc, "count").value_or(0), 4.0);
    EXPECT_EQ(json::getNumber(sc, "mean").value_or(0), 2.5);
    EXPECT_EQ(json::getNumber(sc, "median").value_or(0), 2.5);
    EXPECT_EQ(json::getNumber(sc, "variance").value_or(0), 1.25);
    EXPECT_NEAR(json::getNumber(sc, "stddev").value_or(0), 1.1180339887, 1e-9);
    EXPECT_EQ(typed::firstText(result).value_or("").rfind("count=4 mean=2.5 median=2.5 variance=1.25 stddev=", 0), 0u);
}

TEST(Composition, InvalidArgumentsAreRejectedBeforeExecution) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[]}}})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::InvalidParams);

    reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":"1,2"}}})");
    EXPECT_EQ(errorCode(reply), JSONRPCErrorCodes::InvalidParams);
}

TEST(Composition, ProgressFromEveryLevelReachesTheClientStream) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto stream = std::make_shared<BufferedOutputStream>();
    JsonRpcEndpoint::Session session;
    session.stream = stream;
    auto reply = deliver(endpoint,
        R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[1,3]},"_meta":{"progressToken":"p-1"}}})",
        session);
    EXPECT_EQ(typed::firstText(resultOf(reply)).value_or(""), "1");

    const auto values = progressValues(stream->Drain(), "p-1");
    // variance reports twice from inside stddev, then stddev reports twice, on one sequence.
    EXPECT_EQ(values, (std::vector<double>{1, 2, 3, 4}));
}

TEST(Composition, ProgressOfConcurrentNestedCallsStaysIncreasing) {
    JsonRpcEndpoint endpoint(build("describe,variance,statistics,math"));
    for (int round = 0; round < 20; ++round) {
        auto stream = std::make_shared<BufferedOutputStream>();
        JsonRpcEndpoint::Session session;
        session.stream = stream;
        auto reply = deliver(endpoint,
            R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"describe","arguments":{"numbers":[4,1,3,2]},"_meta":{"progressToken":"d"}}})",
            session);
        ASSERT_FALSE(isError(reply));

        const auto values = progressValues(stream->Drain(), "d");
        ASSERT_EQ(values.size(), 4u);
        for (std::size_t i = 1; i < values.size(); ++i) {
            EXPECT_GT(values[i], values[i - 1]) << "round " << round << " frame " << i;
        }
    }
}

TEST(Composition, NoProgressWithoutToken) {
    JsonRpcEndpoint endpoint(build("stddev,variance,statistics,math"));
    auto stream = std::make_shared<BufferedOutputStream>();
    JsonRpcEndpoint::Session session;
    session.stream = stream;
    deliver(endpoint,
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[1,3]}}})",
        session);
    EXPECT_TRUE(stream->Drain().empty());
}

} // namespace mcpchain
