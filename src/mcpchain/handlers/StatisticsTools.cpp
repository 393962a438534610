//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StatisticsTools.cpp
// Purpose: mean, median and sum over a numbers array
//==========================================================================================================

#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/typed/Content.h"

#include <algorithm>
#include <numeric>

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

double sumOf(const std::vector<double>& xs) {
    return std::accumulate(xs.begin(), xs.end(), 0.0);
}

} // namespace

StatisticsTools::StatisticsTools() : ToolProvider("statistics") {
    AddTool(MakeTool("mean", "Arithmetic mean of the numbers", kNumbersSchema, "Mean"),
    [](const JSONValue& args) {
        const auto xs = json::requireNumberArray(args, "numbers");
        return typed::numberResult(sumOf(xs) / static_cast<double>(xs.size()));
    });

    AddTool(MakeTool("median", "Median of the numbers (mean of the two middle values for even counts)",
                     kNumbersSchema, "Median"),
    [](const JSONValue& args) {
        auto xs = json::requireNumberArray(args, "numbers");
        std::sort(xs.begin(), xs.end());
        const std::size_t mid = xs.size() / 2;
        const double m = (xs.size() % 2 == 1) ? xs[mid] : (xs[mid - 1] + xs[mid]) / 2.0;
        return typed::numberResult(m);
    });

    AddTool(MakeTool("sum", "Sum of the numbers", kNumbersSchema, "Sum"),
    [](const JSONValue& args) {
        return typed::numberResult(sumOf(json::requireNumberArray(args, "numbers")));
    });
}

} // namespace handlers
} // namespace mcpchain
