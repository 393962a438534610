//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerRegistry.h
// Purpose: Build-time alias -> handler factory catalog used to compose chains from alias lists
//==========================================================================================================

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mcpchain/Handler.h"

namespace mcpchain {

//==========================================================================================================
// HandlerRegistry
// Purpose: Maps aliases (e.g. "statistics") to factories producing fresh handler instances.
// Notes:
//   - Consulted only while composing; a built chain never looks aliases up again.
//   - Each Create() returns a new instance so independently built chains share no handler state.
//==========================================================================================================
class HandlerRegistry {
public:
    using Factory = std::function<std::shared_ptr<IHandler>()>;

    //==========================================================================================================
    // Registers (or replaces) a factory under an alias.
    // Args:
    //   alias: Non-empty identifier, case-sensitive.
    //   factory: Callable creating the handler.
    // Returns:
    //   (none). Throws std::invalid_argument for an empty alias or factory.
    //==========================================================================================================
    void Register(const std::string& alias, Factory factory);

    bool Has(const std::string& alias) const;

    // Creates a handler for the alias; nullptr when the alias is unknown.
    std::shared_ptr<IHandler> Create(const std::string& alias) const;

    // Registered aliases in lexical order.
    std::vector<std::string> Aliases() const;

private:
    std::map<std::string, Factory> factories_;
};

} // namespace mcpchain
