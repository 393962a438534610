//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: Tests for the JSON value model, parser/serializer and JSON-RPC message decoding
//==========================================================================================================

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "mcpchain/JSONRPCTypes.h"
#include "mcpchain/JsonAccess.h"

namespace mcpchain {

TEST(Json, SerializesObjectKeysSorted) {
    JSONValue v = ParseJSON(R"({"b":1,"a":[true,null,"x"],"c":{"z":1,"y":2}})");
    EXPECT_EQ(SerializeJSON(v), R"({"a":[true,null,"x"],"b":1,"c":{"y":2,"z":1}})");
}

TEST(Json, IntegerAndDoubleCompareByValue) {
    EXPECT_EQ(ParseJSON("2"), JSONValue(2.0));
    EXPECT_EQ(ParseJSON("2.5"), JSONValue(2.5));
    EXPECT_NE(ParseJSON("2"), JSONValue(std::string("2")));
}

TEST(Json, DoublesUseShortestForm) {
    EXPECT_EQ(SerializeJSON(JSONValue(0.1)), "0.1");
    EXPECT_EQ(SerializeJSON(JSONValue(2.0)), "2");
    EXPECT_EQ(SerializeJSON(JSONValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(SerializeJSON(JSONValue(std::nan(""))), "null");
}

TEST(Json, ParsesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"(["a\"b\\c\n", "\u00e9", "\ud83d\ude00"])");
    const auto& arr = std::get<JSONValue::Array>(v.value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<std::string>(arr[0]->value), "a\"b\\c\n");
    EXPECT_EQ(std::get<std::string>(arr[1]->value), "\xC3\xA9");
    EXPECT_EQ(std::get<std::string>(arr[2]->value), "\xF0\x9F\x98\x80");
}

TEST(Json, RejectsMalformedDocuments) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{} extra"), std::runtime_error);
    EXPECT_THROW(ParseJSON("01"), std::runtime_error);
    EXPECT_THROW(ParseJSON(R"("\ud83d")"), std::runtime_error);
    EXPECT_THROW(ParseJSON(std::string(300, '[') + std::string(300, ']')), std::runtime_error);
}

TEST(Json, AccessHelpers) {
    JSONValue v = ParseJSON(R"({"n":3,"s":"x","xs":[1,2.5],"bad":[1,"2"]})");
    EXPECT_EQ(json::getNumber(v, "n").value(), 3.0);
    EXPECT_EQ(json::getString(v, "s").value(), "x");
    EXPECT_FALSE(json::getString(v, "n").has_value());
    ASSERT_TRUE(json::getNumberArray(v, "xs").has_value());
    EXPECT_EQ(json::getNumberArray(v, "xs").value(), (std::vector<double>{1.0, 2.5}));
    EXPECT_FALSE(json::getNumberArray(v, "bad").has_value());
    EXPECT_THROW(json::requireNumber(v, "missing"), std::invalid_argument);
}

TEST(JsonRpc, RequestRoundTripKeepsIdKind) {
    JSONRPCRequest req(JSONRPCId{static_cast<int64_t>(7)}, "tools/list");
    JSONRPCRequest back;
    ASSERT_TRUE(back.Deserialize(req.Serialize()));
    ASSERT_TRUE(std::holds_alternative<int64_t>(back.id));
    EXPECT_EQ(std::get<int64_t>(back.id), 7);
    EXPECT_EQ(back.method, "tools/list");
}

TEST(JsonRpc, RejectsNonConformingMessages) {
    JSONRPCRequest req;
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"1.0","id":1,"method":"x"})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":5})"));
    EXPECT_FALSE(req.Deserialize(R"({"jsonrpc":"2.0","id":{},"method":"x"})"));

    JSONRPCResponse resp;
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1,"result":1,"error":{"code":1,"message":"m"}})"));
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1})"));

    JSONRPCNotification note;
    EXPECT_FALSE(note.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"x"})"));
    EXPECT_TRUE(note.Deserialize(R"({"jsonrpc":"2.0","method":"x"})"));
}

TEST(JsonRpc, IdToString) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("abc")}), "abc");
    EXPECT_EQ(IdToString(JSONRPCId{static_cast<int64_t>(42)}), "42");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "null");
}

TEST(JsonRpc, ErrorResponseShape) {
    auto resp = CreateErrorResponse(JSONRPCId{std::string("r1")}, JSONRPCErrorCodes::InvalidParams, "bad");
    JSONValue v = ParseJSON(resp->Serialize());
    EXPECT_EQ(SerializeJSON(v), R"({"error":{"code":-32602,"message":"bad"},"id":"r1","jsonrpc":"2.0"})");
}

} // namespace mcpchain
