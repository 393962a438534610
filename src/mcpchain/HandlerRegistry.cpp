//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerRegistry.cpp
// Purpose: Alias -> factory catalog implementation
//==========================================================================================================

#include "mcpchain/HandlerRegistry.h"

#include <stdexcept>

namespace mcpchain {

void HandlerRegistry::Register(const std::string& alias, Factory factory) {
    if (alias.empty()) {
        throw std::invalid_argument("HandlerRegistry: alias must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("HandlerRegistry: factory for '" + alias + "' must not be empty");
    }
    factories_[alias] = std::move(factory);
}

bool HandlerRegistry::Has(const std::string& alias) const {
    return factories_.find(alias) != factories_.end();
}

std::shared_ptr<IHandler> HandlerRegistry::Create(const std::string& alias) const {
    auto it = factories_.find(alias);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second();
}

std::vector<std::string> HandlerRegistry::Aliases() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) {
        out.push_back(kv.first);
    }
    return out;
}

} // namespace mcpchain
