//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StatisticsMiddleware.hpp
// Purpose: Middleware composing the statistics and math primitives into higher-level tools
//==========================================================================================================

#pragma once

#include "mcpchain/ToolHandler.h"

namespace mcpchain {
namespace handlers {

//==========================================================================================================
// VarianceMiddleware ("variance")
// Purpose: variance { numbers } = population variance.
// Downstream: mean (of the numbers, then of the squared deviations).
//==========================================================================================================
class VarianceMiddleware : public Middleware {
public:
    VarianceMiddleware();
};

//==========================================================================================================
// StddevMiddleware ("stddev")
// Purpose: stddev { numbers } = square_root(variance(numbers)).
// Downstream: variance, square_root.
//==========================================================================================================
class StddevMiddleware : public Middleware {
public:
    StddevMiddleware();
};

//==========================================================================================================
// DescribeMiddleware ("describe")
// Purpose: describe { numbers } -> { count, mean, median, variance, stddev } as structured content.
// Downstream: mean, median, variance (issued concurrently), then square_root.
//==========================================================================================================
class DescribeMiddleware : public Middleware {
public:
    DescribeMiddleware();
};

} // namespace handlers
} // namespace mcpchain
