//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MathTools.cpp
// Purpose: square_root and power
//==========================================================================================================

#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/typed/Content.h"

#include <cmath>

namespace mcpchain {
namespace handlers {

MathTools::MathTools() : ToolProvider("math") {
    AddTool(MakeTool("square_root", "Square root of a non-negative number", R"({
        "type": "object",
        "properties": { "value": { "type": "number", "description": "Radicand" } },
        "required": ["value"]
    })", "Square root"),
    [](const JSONValue& args) {
        const double v = json::requireNumber(args, "value");
        if (v < 0.0) {
            return typed::errorResult("Error: Cannot take the square root of a negative number");
        }
        return typed::numberResult(std::sqrt(v));
    });

    AddTool(MakeTool("power", "Raise base to exponent", R"({
        "type": "object",
        "properties": {
            "base": { "type": "number", "description": "Base" },
            "exponent": { "type": "number", "description": "Exponent" }
        },
        "required": ["base", "exponent"]
    })", "Power"),
    [](const JSONValue& args) {
        const double r = std::pow(json::requireNumber(args, "base"), json::requireNumber(args, "exponent"));
        if (!std::isfinite(r)) {
            return typed::errorResult("Error: Result is not a finite number");
        }
        return typed::numberResult(r);
    });
}

} // namespace handlers
} // namespace mcpchain
