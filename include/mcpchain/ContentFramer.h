//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for stdio message framing (newline-delimited or Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace mcpchain {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the buffer (frame, or bad header)
        std::size_t frameSize{0};           // total frame bytes once the header is known (Incomplete/Ok)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

enum class Framing {
    Newline,
    ContentLength
};

// "newline" | "content-length" (case-insensitive); anything else is std::nullopt.
std::optional<Framing> ParseFraming(const std::string& s);
const char* ToString(Framing f);

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 1024 * 1024);
std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength = 1024 * 1024);
std::unique_ptr<IContentFramer> MakeFramer(Framing framing, std::size_t maxMessageLength = 1024 * 1024);

} // namespace mcpchain
