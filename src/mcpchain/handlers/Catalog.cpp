//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalog.cpp
// Purpose: Built-in handler registrations
//==========================================================================================================

#include "mcpchain/handlers/Catalog.hpp"
#include "mcpchain/handlers/LifecycleHandler.hpp"
#include "mcpchain/handlers/StatisticsMiddleware.hpp"
#include "mcpchain/handlers/ToolProviders.hpp"

namespace mcpchain {
namespace handlers {

namespace {
template <typename T>
HandlerRegistry::Factory factoryFor() {
    return []() -> std::shared_ptr<IHandler> { return std::make_shared<T>(); };
}
} // namespace

void RegisterBuiltinHandlers(HandlerRegistry& registry) {
    registry.Register("lifecycle", factoryFor<LifecycleHandler>());
    registry.Register("math", factoryFor<MathTools>());
    registry.Register("statistics", factoryFor<StatisticsTools>());
    registry.Register("variance", factoryFor<VarianceMiddleware>());
    registry.Register("stddev", factoryFor<StddevMiddleware>());
    registry.Register("describe", factoryFor<DescribeMiddleware>());
    registry.Register("calculator", factoryFor<CalculatorTools>());
    registry.Register("string-utils", factoryFor<StringUtilsTools>());
    registry.Register("system-info", factoryFor<SystemInfoTools>());
}

std::shared_ptr<const HandlerRegistry> MakeBuiltinRegistry() {
    auto registry = std::make_shared<HandlerRegistry>();
    RegisterBuiltinHandlers(*registry);
    return registry;
}

} // namespace handlers
} // namespace mcpchain
