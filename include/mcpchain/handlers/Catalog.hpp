//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalog.hpp
// Purpose: Registration of the built-in handlers under their composition aliases
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpchain/HandlerRegistry.h"

namespace mcpchain {
namespace handlers {

//==========================================================================================================
// RegisterBuiltinHandlers
// Purpose: Registers lifecycle, math, statistics, variance, stddev, describe, calculator, string-utils
//          and system-info.
//==========================================================================================================
void RegisterBuiltinHandlers(HandlerRegistry& registry);

// Registry holding only the built-in handlers.
std::shared_ptr<const HandlerRegistry> MakeBuiltinRegistry();

} // namespace handlers
} // namespace mcpchain
