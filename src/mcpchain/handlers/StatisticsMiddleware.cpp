//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StatisticsMiddleware.cpp
// Purpose: variance, stddev and describe composed from downstream tools
//==========================================================================================================

#include "mcpchain/handlers/StatisticsMiddleware.hpp"
#include "mcpchain/typed/Content.h"
#include "logging/Logger.h"

namespace mcpchain {
namespace handlers {

namespace {

constexpr const char* kNumbersSchema = R"({
    "type": "object",
    "properties": {
        "numbers": { "type": "array", "items": { "type": "number" }, "minItems": 1,
                     "description": "Sample values" }
    },
    "required": ["numbers"]
})";

JSONValue numbersArgs(const std::vector<double>& xs) {
    JSONValue::Object o;
    json::set(o, "numbers", json::numberArray(xs));
    return JSONValue{std::move(o)};
}

JSONValue valueArgs(double v) {
    JSONValue::Object o;
    json::set(o, "value", JSONValue{v});
    return JSONValue{std::move(o)};
}

CallToolParams call(const std::string& tool, JSONValue args) {
    CallToolParams p;
    p.name = tool;
    p.arguments = std::move(args);
    return p;
}

} // namespace

VarianceMiddleware::VarianceMiddleware() : Middleware("variance", {"mean"}) {
    AddComposedTool(MakeTool("variance", "Population variance of the numbers", kNumbersSchema, "Variance"),
    [](const RequestContext& ctx, const JSONValue& args, DownstreamClient& downstream) {
        const auto xs = json::requireNumberArray(args, "numbers");
        const double m = downstream.CallNumber("mean", numbersArgs(xs));
        ctx.AdvanceProgress(std::string("mean computed"));

        std::vector<double> squared;
        squared.reserve(xs.size());
        for (double x : xs) {
            squared.push_back((x - m) * (x - m));
        }
        const double v = downstream.CallNumber("mean", numbersArgs(squared));
        ctx.AdvanceProgress(std::string("variance computed"));
        return typed::numberResult(v);
    });
}

StddevMiddleware::StddevMiddleware() : Middleware("stddev", {"variance", "square_root"}) {
    AddComposedTool(MakeTool("stddev", "Population standard deviation of the numbers", kNumbersSchema,
                             "Standard deviation"),
    [](const RequestContext& ctx, const JSONValue& args, DownstreamClient& downstream) {
        const double v = downstream.CallNumber("variance", args);
        ctx.AdvanceProgress(std::string("variance computed"));
        const double s = downstream.CallNumber("square_root", valueArgs(v));
        ctx.AdvanceProgress(std::string("square root computed"));
        return typed::numberResult(s);
    });
}

DescribeMiddleware::DescribeMiddleware() : Middleware("describe", {"mean", "median", "variance", "square_root"}) {
    Tool tool = MakeTool("describe", "Summary statistics of the numbers", kNumbersSchema, "Describe");
    tool.outputSchema = ParseJSON(R"({
        "type": "object",
        "properties": {
            "count": { "type": "integer" },
            "mean": { "type": "number" },
            "median": { "type": "number" },
            "variance": { "type": "number" },
            "stddev": { "type": "number" }
        },
        "required": ["count", "mean", "median", "variance", "stddev"]
    })");

    AddComposedTool(std::move(tool),
    [](const RequestContext& ctx, const JSONValue& args, DownstreamClient& downstream) {
        const auto xs = json::requireNumberArray(args, "numbers");
        const JSONValue numbers = numbersArgs(xs);
        const auto stats = downstream.CallNumbersConcurrently({
            call("mean", numbers), call("median", numbers), call("variance", numbers)});
        ctx.AdvanceProgress(std::string("mean, median and variance computed"));
        const double stddev = downstream.CallNumber("square_root", valueArgs(stats[2]));
        ctx.AdvanceProgress(std::string("stddev computed"));

        JSONValue::Object sc;
        json::set(sc, "count", JSONValue{static_cast<int64_t>(xs.size())});
        json::set(sc, "mean", JSONValue{stats[0]});
        json::set(sc, "median", JSONValue{stats[1]});
        json::set(sc, "variance", JSONValue{stats[2]});
        json::set(sc, "stddev", JSONValue{stddev});

        CallToolResult r = typed::textResult(
            "count=" + std::to_string(xs.size()) + " mean=" + typed::formatNumber(stats[0]) +
            " median=" + typed::formatNumber(stats[1]) + " variance=" + typed::formatNumber(stats[2]) +
            " stddev=" + typed::formatNumber(stddev));
        r.structuredContent = JSONValue{std::move(sc)};
        LOG_DEBUG("describe: {} (trace={})", typed::firstText(r).value_or(""), ctx.TraceId());
        return r;
    });
}

} // namespace handlers
} // namespace mcpchain
