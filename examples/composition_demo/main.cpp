//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: In-process walkthrough of chain composition: discovery, nested calls, misordered pipelines
//==========================================================================================================

#include <iostream>
#include <string>

#include "mcpchain/Chain.h"
#include "mcpchain/JsonRpcEndpoint.h"
#include "mcpchain/handlers/Catalog.hpp"

using namespace mcpchain;

static void show(JsonRpcEndpoint& endpoint, const std::string& request) {
    std::cout << "  -> " << request << "\n";
    auto reply = endpoint.Deliver(request);
    std::cout << "  <- " << reply.value_or("(no response)") << "\n";
}

int main() {
    auto registry = handlers::MakeBuiltinRegistry();

    std::cout << "1) lifecycle,stddev,variance,statistics,math\n";
    JsonRpcEndpoint good(ChainBuilder(registry).FromAliasList("lifecycle,stddev,variance,statistics,math").Build());
    show(good, R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"demo","version":"1"}}})");
    show(good, R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    show(good, R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"stddev","arguments":{"numbers":[2,4,4,4,5,5,7,9]}}})");

    std::cout << "\n2) statistics,variance (variance cannot reach mean)\n";
    JsonRpcEndpoint misordered(ChainBuilder(registry).FromAliasList("statistics,variance").Build());
    show(misordered, R"({"jsonrpc":"2.0","id":"a","method":"tools/call","params":{"name":"variance","arguments":{"numbers":[1,2,3]}}})");

    std::cout << "\n3) describe,variance,statistics,math\n";
    JsonRpcEndpoint describe(ChainBuilder(registry).FromAliasList("describe,variance,statistics,math").Build());
    show(describe, R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"describe","arguments":{"numbers":[1,2,3,4]}}})");
    show(describe, R"({"jsonrpc":"2.0","id":8,"method":"tools/frobnicate"})");
    return 0;
}
