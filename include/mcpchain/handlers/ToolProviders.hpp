//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolProviders.hpp
// Purpose: Leaf tool providers of the built-in catalog
//==========================================================================================================

#pragma once

#include "mcpchain/ToolHandler.h"

namespace mcpchain {
namespace handlers {

//==========================================================================================================
// MathTools ("math")
// Tools:
//   square_root { value }       -> sqrt(value); a negative value is an isError result
//   power { base, exponent }    -> base^exponent; a non-finite outcome is an isError result
//==========================================================================================================
class MathTools : public ToolProvider {
public:
    MathTools();
};

//==========================================================================================================
// StatisticsTools ("statistics")
// Tools (numbers: non-empty array of numbers):
//   mean, median, sum
//==========================================================================================================
class StatisticsTools : public ToolProvider {
public:
    StatisticsTools();
};

//==========================================================================================================
// CalculatorTools ("calculator")
// Tools: add, subtract, multiply, divide { a, b }. Division by zero -> "Error: Division by zero" (isError).
//==========================================================================================================
class CalculatorTools : public ToolProvider {
public:
    CalculatorTools();
};

//==========================================================================================================
// StringUtilsTools ("string-utils")
// Tools { text }: uppercase, lowercase, reverse (by code point), word_count ("<n> words").
//==========================================================================================================
class StringUtilsTools : public ToolProvider {
public:
    StringUtilsTools();
};

//==========================================================================================================
// SystemInfoTools ("system-info")
// Tools:
//   timestamp            -> Unix time in seconds
//   random_uuid          -> random (version 4) UUID
//   base64_encode { text }
//   base64_decode { text } -> "Invalid base64: ..." / "Decoded data is not valid UTF-8 text" on failure
//==========================================================================================================
class SystemInfoTools : public ToolProvider {
public:
    SystemInfoTools();
};

} // namespace handlers
} // namespace mcpchain
