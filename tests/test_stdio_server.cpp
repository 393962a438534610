//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_server.cpp
// Purpose: Stream server over in-memory streams with both framings
//==========================================================================================================

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "mcpchain/Chain.h"
#include "mcpchain/JsonAccess.h"
#include "mcpchain/StdioServer.hpp"
#include "mcpchain/handlers/Catalog.hpp"

namespace mcpchain {

namespace {

std::shared_ptr<const Chain> catalogChain() {
    return ChainBuilder(handlers::MakeBuiltinRegistry()).FromAliasList("lifecycle,stddev,variance,statistics,math").Build();
}

std::vector<std::string> lines(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(line);
    }
    return out;
}

std::string frame(const std::string& payload) {
    return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" + payload;
}

} // namespace

TEST(StdioServer, NewlineFramingAnswersRequestsInOrder) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\r\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"sum","arguments":{"numbers":[1,2]}}})" "\n");
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::Newline, in, out);
    EXPECT_EQ(server.Run(), 3u);

    auto replies = lines(out.str());
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0], R"({"id":1,"jsonrpc":"2.0","result":{}})");
    auto second = ParseJSON(replies[1]);
    EXPECT_EQ(json::getNumber(second, "id").value_or(0), 2.0);
    EXPECT_NE(json::member(second, "result"), nullptr);
}

TEST(StdioServer, MalformedLineGetsParseError) {
    std::istringstream in("this is not json\n" R"({"jsonrpc":"2.0","id":"after","method":"ping"})" "\n");
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::Newline, in, out);
    server.Run();

    auto replies = lines(out.str());
    ASSERT_EQ(replies.size(), 2u);
    const JSONValue first = ParseJSON(replies[0]);
    const JSONValue* err = json::member(first, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(json::getNumber(*err, "code").value_or(0), static_cast<double>(JSONRPCErrorCodes::ParseError));
    EXPECT_EQ(json::getString(ParseJSON(replies[1]), "id").value_or(""), "after");
}

TEST(StdioServer, ProgressNotificationsPrecedeTheReply) {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[1,3]},"_meta":{"progressToken":"tok"}}})" "\n");
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::Newline, in, out);
    server.Run();

    auto written = lines(out.str());
    ASSERT_EQ(written.size(), 5u);
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(json::getString(ParseJSON(written[i]), "method").value_or(""), "notifications/progress");
    }
    EXPECT_EQ(json::getNumber(ParseJSON(written[4]), "id").value_or(0), 5.0);
}

TEST(StdioServer, ContentLengthFraming) {
    std::istringstream in(frame(R"({"jsonrpc":"2.0","id":1,"method":"ping"})") +
                          frame(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"square_root","arguments":{"value":81}}})"));
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::ContentLength, in, out);
    EXPECT_EQ(server.Run(), 2u);

    const std::string ping = R"({"id":1,"jsonrpc":"2.0","result":{}})";
    const std::string expectedPrefix = frame(ping);
    ASSERT_GE(out.str().size(), expectedPrefix.size());
    EXPECT_EQ(out.str().substr(0, expectedPrefix.size()), expectedPrefix);
    EXPECT_NE(out.str().find("Content-Length: ", expectedPrefix.size()), std::string::npos);
    EXPECT_NE(out.str().find(R"("text":"9")"), std::string::npos);
}

TEST(StdioServer, StopsAtEndOfInput) {
    std::istringstream in("");
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::Newline, in, out);
    EXPECT_EQ(server.Run(), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(StdioServer, OversizedLineIsDropped) {
    std::istringstream in(std::string(64, 'x') + "\n" + R"({"jsonrpc":"2.0","id":1,"method":"ping"})" + "\n");
    std::ostringstream out;
    StdioServer server(catalogChain(), Framing::Newline, in, out);
    server.SetMaxMessageLength(48);
    EXPECT_EQ(server.Run(), 1u);
    EXPECT_EQ(lines(out.str()).size(), 1u);
}

} // namespace mcpchain
