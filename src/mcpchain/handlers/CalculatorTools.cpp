//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CalculatorTools.cpp
// Purpose: Binary arithmetic tools
//==========================================================================================================

#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/typed/Content.h"

#include <functional>

namespace mcpchain {
namespace handlers {

namespace {

std::string operandSchema(const char* aDescription, const char* bDescription) {
    return std::string(R"({"type":"object","properties":{"a":{"type":"number","description":")") +
           aDescription + R"("},"b":{"type":"number","description":")" + bDescription +
           R"("}},"required":["a","b"]})";
}

std::function<CallToolResult(const JSONValue&)> binary(std::function<double(double, double)> op) {
    return [op = std::move(op)](const JSONValue& args) {
        return typed::numberResult(op(json::requireNumber(args, "a"), json::requireNumber(args, "b")));
    };
}

} // namespace

CalculatorTools::CalculatorTools() : ToolProvider("calculator") {
    AddTool(MakeTool("add", "Add two numbers together", operandSchema("First number", "Second number"), "Add"),
            binary(std::plus<double>()));
    AddTool(MakeTool("subtract", "Subtract b from a", operandSchema("Number to subtract from", "Number to subtract"),
                     "Subtract"),
            binary(std::minus<double>()));
    AddTool(MakeTool("multiply", "Multiply two numbers", operandSchema("First number", "Second number"), "Multiply"),
            binary(std::multiplies<double>()));
    AddTool(MakeTool("divide", "Divide a by b", operandSchema("Dividend", "Divisor"), "Divide"),
    [](const JSONValue& args) {
        const double b = json::requireNumber(args, "b");
        if (b == 0.0) {
            return typed::errorResult("Error: Division by zero");
        }
        return typed::numberResult(json::requireNumber(args, "a") / b);
    });
}

} // namespace handlers
} // namespace mcpchain
