//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration from --key=value options with MCPCHAIN_* environment fallbacks
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpchain/ContentFramer.h"
#include "mcpchain/validation/Validation.h"

namespace mcpchain {

// Full handler catalog, composed so that every middleware finds its tools downstream.
constexpr const char* DEFAULT_CHAIN =
    "lifecycle,describe,stddev,variance,statistics,math,calculator,string-utils,system-info";

//==========================================================================================================
// ServerConfig
// Purpose: Settings of the mcpchain_server executable.
// Fields:
//   transport: "stdio" or "http"
//   listen: HTTP listen URL (see ParseListenUrl)
//   chain: Comma separated handler aliases, head first
//   framing: stdio framing
//   validation: Composition diagnostics mode
//   logLevel/logFile: Logger settings (logFile empty = no file)
//==========================================================================================================
struct ServerConfig {
    std::string transport{"stdio"};
    std::string listen{"http://127.0.0.1:8080/mcp"};
    std::string chain{DEFAULT_CHAIN};
    Framing framing{Framing::Newline};
    validation::ValidationMode validation{validation::ValidationMode::Off};
    std::string logLevel{"INFO"};
    std::string logFile;
};

//==========================================================================================================
// Returns the value of a "--key=value" argument; std::nullopt when absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(const std::vector<std::string>& args, const std::string& key);

//==========================================================================================================
// ParseServerConfig
// Purpose: Resolves every setting from (in order) the command line, MCPCHAIN_* variables, defaults.
// Args:
//   args: Command-line arguments without the program name.
// Returns:
//   The configuration. Throws std::invalid_argument for an unknown transport, framing or validation
//   mode, or an unknown "--" option.
//==========================================================================================================
ServerConfig ParseServerConfig(const std::vector<std::string>& args);

std::string Usage();

} // namespace mcpchain
