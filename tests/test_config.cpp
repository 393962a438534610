//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Server configuration precedence and listen URL parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcpchain/Config.h"
#include "mcpchain/HTTPServer.hpp"

namespace mcpchain {

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }

private:
    const char* name_;
};

} // namespace

TEST(Config, Defaults) {
    auto cfg = ParseServerConfig({});
    EXPECT_EQ(cfg.transport, "stdio");
    EXPECT_EQ(cfg.chain, DEFAULT_CHAIN);
    EXPECT_EQ(cfg.framing, Framing::Newline);
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Off);
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_TRUE(cfg.logFile.empty());
}

TEST(Config, CommandLineValues) {
    auto cfg = ParseServerConfig({"--transport=HTTP", "--listen=http://0.0.0.0:9000/rpc", "--chain=math",
                                  "--framing=content-length", "--validation=strict", "--log-level=DEBUG",
                                  "--log-file=/tmp/mcpchain.log"});
    EXPECT_EQ(cfg.transport, "http");
    EXPECT_EQ(cfg.listen, "http://0.0.0.0:9000/rpc");
    EXPECT_EQ(cfg.chain, "math");
    EXPECT_EQ(cfg.framing, Framing::ContentLength);
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Strict);
    EXPECT_EQ(cfg.logLevel, "DEBUG");
    EXPECT_EQ(cfg.logFile, "/tmp/mcpchain.log");
}

TEST(Config, EnvironmentFallsBehindCommandLine) {
    ScopedEnv chain("MCPCHAIN_CHAIN", "statistics");
    ScopedEnv framing("MCPCHAIN_FRAMING", "content-length");
    auto cfg = ParseServerConfig({});
    EXPECT_EQ(cfg.chain, "statistics");
    EXPECT_EQ(cfg.framing, Framing::ContentLength);

    cfg = ParseServerConfig({"--chain=math"});
    EXPECT_EQ(cfg.chain, "math");
}

TEST(Config, RejectsUnknownValues) {
    EXPECT_THROW(ParseServerConfig({"--transport=carrier-pigeon"}), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig({"--framing=xml"}), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig({"--validation=maybe"}), std::invalid_argument);
    EXPECT_THROW(ParseServerConfig({"--color=blue"}), std::invalid_argument);
}

TEST(Config, GetArgValueMatchesWholeKey) {
    const std::vector<std::string> args{"--chainx=1", "--chain=a,b", "--empty="};
    EXPECT_EQ(GetArgValue(args, "--chain").value_or(""), "a,b");
    EXPECT_EQ(GetArgValue(args, "--empty").value_or("unset"), "");
    EXPECT_FALSE(GetArgValue(args, "--missing").has_value());
}

TEST(Config, UsageNamesTheDefaultChain) {
    EXPECT_NE(Usage().find(DEFAULT_CHAIN), std::string::npos);
}

TEST(ListenUrl, HttpWithPath) {
    auto o = ParseListenUrl("http://127.0.0.1:0/mcp");
    EXPECT_EQ(o.scheme, "http");
    EXPECT_EQ(o.address, "127.0.0.1");
    EXPECT_EQ(o.port, "0");
    EXPECT_EQ(o.path, "/mcp");
}

TEST(ListenUrl, DefaultsAndIpv6) {
    auto o = ParseListenUrl("localhost");
    EXPECT_EQ(o.scheme, "http");
    EXPECT_EQ(o.address, "localhost");
    EXPECT_EQ(o.port, "8080");
    EXPECT_EQ(o.path, "/mcp");

    o = ParseListenUrl("http://[::1]:9001/rpc");
    EXPECT_EQ(o.address, "::1");
    EXPECT_EQ(o.port, "9001");
    EXPECT_EQ(o.path, "/rpc");
}

TEST(ListenUrl, HttpsWithCertificates) {
    auto o = ParseListenUrl("https://0.0.0.0:8443/mcp?cert=server.pem&key=server.key");
    EXPECT_EQ(o.scheme, "https");
    EXPECT_EQ(o.port, "8443");
    EXPECT_EQ(o.path, "/mcp");
    EXPECT_EQ(o.certFile, "server.pem");
    EXPECT_EQ(o.keyFile, "server.key");
}

} // namespace mcpchain
