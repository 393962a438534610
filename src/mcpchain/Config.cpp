//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Server configuration parsing
//==========================================================================================================

#include "mcpchain/Config.h"
#include "env/EnvVars.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace mcpchain {

namespace {

const std::array<const char*, 8> kKnownOptions = {
    "--transport", "--listen", "--chain", "--framing", "--validation", "--log-level", "--log-file", "--help"
};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

// CLI value, else environment variable, else default.
std::string resolve(const std::vector<std::string>& args, const std::string& key, const char* envName,
                    const std::string& defaultValue) {
    if (auto v = GetArgValue(args, key); v.has_value()) {
        return v.value();
    }
    return GetEnvOrDefault(envName, defaultValue);
}

} // namespace

std::optional<std::string> GetArgValue(const std::vector<std::string>& args, const std::string& key) {
    for (const auto& a : args) {
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.compare(0, eq, key) == 0 && eq == key.size()) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

ServerConfig ParseServerConfig(const std::vector<std::string>& args) {
    for (const auto& a : args) {
        const std::string key = a.substr(0, a.find('='));
        if (std::find(kKnownOptions.begin(), kKnownOptions.end(), key) == kKnownOptions.end()) {
            throw std::invalid_argument("Unknown option: " + a);
        }
    }

    ServerConfig cfg;
    cfg.transport = lower(resolve(args, "--transport", "MCPCHAIN_TRANSPORT", cfg.transport));
    if (cfg.transport != "stdio" && cfg.transport != "http") {
        throw std::invalid_argument("Unknown transport '" + cfg.transport + "' (expected stdio|http)");
    }
    cfg.listen = resolve(args, "--listen", "MCPCHAIN_LISTEN", cfg.listen);
    cfg.chain = resolve(args, "--chain", "MCPCHAIN_CHAIN", cfg.chain);

    const std::string framing = resolve(args, "--framing", "MCPCHAIN_FRAMING", ToString(cfg.framing));
    auto parsedFraming = ParseFraming(framing);
    if (!parsedFraming.has_value()) {
        throw std::invalid_argument("Unknown framing '" + framing + "' (expected newline|content-length)");
    }
    cfg.framing = parsedFraming.value();

    const std::string mode = lower(resolve(args, "--validation", "MCPCHAIN_VALIDATION", "off"));
    if (mode != "off" && mode != "strict") {
        throw std::invalid_argument("Unknown validation mode '" + mode + "' (expected off|strict)");
    }
    cfg.validation = validation::parseMode(mode);

    cfg.logLevel = resolve(args, "--log-level", "MCPCHAIN_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = resolve(args, "--log-file", "MCPCHAIN_LOG_FILE", cfg.logFile);
    return cfg;
}

std::string Usage() {
    return std::string(
        "usage: mcpchain_server [--transport=stdio|http] [--listen=<http(s)://addr:port[/path][?cert=..&key=..]>]\n"
        "                       [--chain=<alias,alias,...>] [--framing=newline|content-length]\n"
        "                       [--validation=off|strict] [--log-level=<level>] [--log-file=<path>]\n"
        "environment: MCPCHAIN_TRANSPORT MCPCHAIN_LISTEN MCPCHAIN_CHAIN MCPCHAIN_FRAMING\n"
        "             MCPCHAIN_VALIDATION MCPCHAIN_LOG_LEVEL MCPCHAIN_LOG_FILE\n"
        "default chain: ") + DEFAULT_CHAIN + "\n";
}

} // namespace mcpchain
