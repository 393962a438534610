//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for typed error structures and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpchain/JSONRPCTypes.h"
#include "mcpchain/JsonAccess.h"
#include "mcpchain/DownstreamClient.h"
#include "mcpchain/errors/Errors.h"

using namespace mcpchain;

TEST(Errors, CategoryMapping) {
    using mcpchain::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::DownstreamError), ErrorCategory::DownstreamError);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::DownstreamToolMissing), ErrorCategory::DownstreamToolMissing);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
    EXPECT_STREQ(errors::toString(ErrorCategory::DownstreamToolMissing), "DownstreamToolMissing");
}

TEST(Errors, FromErrorValue) {
    auto err = errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":-32602,"message":"bad","data":{"x":1}})"));
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(err->message, "bad");
    ASSERT_TRUE(err->data.has_value());
    EXPECT_EQ(json::getNumber(err->data.value(), "x").value(), 1.0);

    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"code":"x","message":"bad"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON(R"({"message":"bad"})")).has_value());
    EXPECT_FALSE(errors::mcpErrorFromErrorValue(ParseJSON("[]")).has_value());
}

TEST(Errors, ResponseRoundTrip) {
    auto resp = errors::makeErrorResponse(JSONRPCId{static_cast<int64_t>(3)}, errors::invalidParams("x missing"));
    auto err = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "Invalid params: x missing");
    EXPECT_EQ(err->category, errors::ErrorCategory::JsonRpcInvalidParams);
    EXPECT_FALSE(errors::mcpErrorFromResponse(*CreateResultResponse(JSONRPCId{nullptr}, JSONValue{})).has_value());
}

TEST(Errors, DownstreamToolMissingMessage) {
    auto err = MakeDownstreamToolMissing("mean", "variance");
    EXPECT_EQ(err.code, -32011);
    EXPECT_EQ(err.message,
              "Tool 'mean' required by 'variance' was not found downstream. "
              "Compose the handler that provides 'mean' after 'variance' in the pipeline.");
    ASSERT_TRUE(err.data.has_value());
    EXPECT_EQ(json::getString(err.data.value(), "tool").value(), "mean");
    EXPECT_EQ(json::getString(err.data.value(), "requiredBy").value(), "variance");
}

TEST(Errors, DownstreamErrorCarriesCause) {
    auto err = MakeDownstreamError("divide", "Error: Division by zero", JSONValue{std::string("Error: Division by zero")});
    EXPECT_EQ(err.code, -32010);
    EXPECT_EQ(err.message, "Downstream call to 'divide' failed: Error: Division by zero");
    EXPECT_EQ(json::getString(err.data.value(), "target").value(), "divide");
    EXPECT_EQ(json::getString(err.data.value(), "cause").value(), "Error: Division by zero");

    errors::DownstreamCallError thrown(err);
    EXPECT_STREQ(thrown.what(), err.message.c_str());
    EXPECT_EQ(thrown.error().code, -32010);
}
