//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Validation modes for chain composition diagnostics (Off by default)
//==========================================================================================================

#pragma once

#include <string>

namespace mcpchain {
namespace validation {

// Off: ordering/collision findings are logged as warnings. Strict: they abort composition.
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

inline ValidationMode parseMode(const std::string& s) {
    if (s == "strict" || s == "Strict" || s == "STRICT") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace mcpchain
