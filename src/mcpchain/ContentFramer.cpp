//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.cpp
// Purpose: Newline-delimited and Content-Length framers for the stdio server
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "mcpchain/ContentFramer.h"

namespace mcpchain {

namespace {
class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                if (name == "content-length") {
                    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char ch){ return std::isdigit(ch) || std::isspace(ch); })) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    unsigned long long v64 = 0;
                    try {
                        v64 = std::stoull(value);
                    } catch (const std::exception&) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
                    }
                    if (v64 > maxContentLength || v64 > std::numeric_limits<std::size_t>::max() - headerAndSep) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64, maxContentLength);
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep };
                    }
                    contentLength = static_cast<std::size_t>(v64);
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep };
        }

        const std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0, frameTotal };
        }
        return { DecodeStatus::Ok, buffer.substr(headerAndSep, contentLength), frameTotal, frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};

//========================================================================================================
// NewlineFramer: one JSON text per line (MCP stdio default). Blank lines are skipped, CR before LF dropped.
//========================================================================================================
class NewlineFramer : public IContentFramer {
public:
    explicit NewlineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        return payload + "\n";
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Line exceeds limit (max={})", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Leading blank lines may be dropped even while the next line is incomplete
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') --end;
            std::string line = buffer.substr(start, end - start);
            if (line.find_first_not_of(" \t") == std::string::npos) {
                start = eol + 1;
                continue;
            }
            if (line.size() > maxLineLength) {
                LOG_WARN("Line exceeds limit (max={})", maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, std::move(line), eol + 1, eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            buffer.erase(0, r.bytesConsumed);
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};
} // namespace

std::optional<Framing> ParseFraming(const std::string& s) {
    std::string v; v.reserve(s.size());
    for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (v == "newline" || v == "ndjson" || v == "line") return Framing::Newline;
    if (v == "content-length" || v == "contentlength" || v == "lsp") return Framing::ContentLength;
    return std::nullopt;
}

const char* ToString(Framing f) {
    switch (f) {
        case Framing::ContentLength: return "content-length";
        case Framing::Newline:
        default: return "newline";
    }
}

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeNewlineFramer(std::size_t maxLineLength) {
    return std::make_unique<NewlineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeFramer(Framing framing, std::size_t maxMessageLength) {
    if (framing == Framing::ContentLength) {
        return MakeContentLengthFramer(maxMessageLength);
    }
    return MakeNewlineFramer(maxMessageLength);
}

} // namespace mcpchain
