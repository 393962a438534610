//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SystemInfoTools.cpp
// Purpose: Clock, UUID and base64 tools
//==========================================================================================================

#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/typed/Content.h"

#include <chrono>
#include <cstdint>
#include <vector>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <openssl/evp.h>

namespace mcpchain {
namespace handlers {

namespace {

constexpr const char* kNoArgsSchema = R"({"type":"object","properties":{}})";

std::string base64Encode(const std::string& in) {
    std::string out(4 * ((in.size() + 2) / 3), '\0');
    const int n = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                    reinterpret_cast<const unsigned char*>(in.data()),
                                    static_cast<int>(in.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

bool isBase64Char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

//==========================================================================================================
// Decodes standard padded base64. Returns an error description (without the "Invalid base64: " prefix)
// through err when the input is rejected.
//==========================================================================================================
std::optional<std::string> base64Decode(const std::string& in, std::string& err) {
    if (in.size() % 4 != 0) {
        err = "invalid length " + std::to_string(in.size());
        return std::nullopt;
    }
    std::size_t padding = 0;
    for (std::size_t i = 0; i < in.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(in[i]);
        if (c == '=') {
            if (i + 2 < in.size() || ++padding > 2) {
                err = "invalid padding at offset " + std::to_string(i);
                return std::nullopt;
            }
            continue;
        }
        if (padding > 0 || !isBase64Char(c)) {
            err = "invalid byte at offset " + std::to_string(i);
            return std::nullopt;
        }
    }
    if (in.empty()) {
        return std::string();
    }
    std::vector<unsigned char> out(3 * in.size() / 4);
    const int n = ::EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(in.data()),
                                    static_cast<int>(in.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        err = "decoder rejected input";
        return std::nullopt;
    }
    // EVP_DecodeBlock counts the padding bytes as decoded zeros.
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n) - padding);
}

bool isValidUtf8(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        std::size_t len = 0;
        uint32_t cp = 0;
        if (c < 0x80) { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;
        if (i + len > s.size()) return false;
        for (std::size_t k = 1; k < len; ++k) {
            const unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and values past U+10FFFF
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) return false;
        i += len;
    }
    return true;
}

} // namespace

SystemInfoTools::SystemInfoTools() : ToolProvider("system-info") {
    AddTool(MakeTool("timestamp", "Get current Unix timestamp", kNoArgsSchema, "Timestamp"),
    [](const JSONValue&) {
        const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        CallToolResult r = typed::textResult(std::to_string(secs));
        JSONValue::Object sc;
        json::set(sc, "value", JSONValue{static_cast<int64_t>(secs)});
        r.structuredContent = JSONValue{std::move(sc)};
        return r;
    });

    AddTool(MakeTool("random_uuid", "Generate a random UUID v4", kNoArgsSchema, "Random UUID"),
    [](const JSONValue&) {
        boost::uuids::random_generator gen;
        return typed::textResult(boost::uuids::to_string(gen()));
    });

    AddTool(MakeTool("base64_encode", "Encode string to base64",
                     R"({"type":"object","properties":{"text":{"type":"string","description":"Text to encode to base64"}},"required":["text"]})",
                     "Base64 encode"),
    [](const JSONValue& args) {
        return typed::textResult(base64Encode(json::requireString(args, "text")));
    });

    AddTool(MakeTool("base64_decode", "Decode base64 to string",
                     R"({"type":"object","properties":{"text":{"type":"string","description":"Base64 text to decode"}},"required":["text"]})",
                     "Base64 decode"),
    [](const JSONValue& args) {
        std::string err;
        auto decoded = base64Decode(json::requireString(args, "text"), err);
        if (!decoded.has_value()) {
            return typed::errorResult("Invalid base64: " + err);
        }
        if (!isValidUtf8(decoded.value())) {
            return typed::errorResult("Decoded data is not valid UTF-8 text");
        }
        return typed::textResult(decoded.value());
    });
}

} // namespace handlers
} // namespace mcpchain
