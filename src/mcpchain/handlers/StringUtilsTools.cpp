//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StringUtilsTools.cpp
// Purpose: Text transformation tools
//==========================================================================================================

#include "mcpchain/handlers/ToolProviders.hpp"
#include "mcpchain/typed/Content.h"

#include <algorithm>
#include <locale>
#include <sstream>

#include <boost/locale.hpp>

namespace mcpchain {
namespace handlers {

namespace {

std::string textSchema(const char* description) {
    return std::string(R"({"type":"object","properties":{"text":{"type":"string","description":")") +
           description + R"("}},"required":["text"]})";
}

// UTF-8 locale for full Unicode case mapping ("stra\u00dfe" -> "STRASSE"), generated once.
const std::locale& utf8Locale() {
    static const std::locale loc = boost::locale::generator()("en_US.UTF-8");
    return loc;
}

// Reverses code points, keeping each UTF-8 sequence intact.
std::string reverseCodePoints(const std::string& s) {
    std::vector<std::string> points;
    for (std::size_t i = 0; i < s.size();) {
        std::size_t len = 1;
        const unsigned char lead = static_cast<unsigned char>(s[i]);
        if (lead >= 0xF0) len = 4;
        else if (lead >= 0xE0) len = 3;
        else if (lead >= 0xC0) len = 2;
        len = std::min(len, s.size() - i);
        points.push_back(s.substr(i, len));
        i += len;
    }
    std::string out;
    out.reserve(s.size());
    for (auto it = points.rbegin(); it != points.rend(); ++it) {
        out += *it;
    }
    return out;
}

std::size_t countWords(const std::string& s) {
    std::istringstream in(s);
    std::size_t n = 0;
    std::string word;
    while (in >> word) {
        ++n;
    }
    return n;
}

} // namespace

StringUtilsTools::StringUtilsTools() : ToolProvider("string-utils") {
    AddTool(MakeTool("uppercase", "Convert text to uppercase", textSchema("Text to convert to uppercase"), "Uppercase"),
    [](const JSONValue& args) {
        return typed::textResult(boost::locale::to_upper(json::requireString(args, "text"), utf8Locale()));
    });

    AddTool(MakeTool("lowercase", "Convert text to lowercase", textSchema("Text to convert to lowercase"), "Lowercase"),
    [](const JSONValue& args) {
        return typed::textResult(boost::locale::to_lower(json::requireString(args, "text"), utf8Locale()));
    });

    AddTool(MakeTool("reverse", "Reverse a string", textSchema("Text to reverse"), "Reverse"),
    [](const JSONValue& args) {
        return typed::textResult(reverseCodePoints(json::requireString(args, "text")));
    });

    AddTool(MakeTool("word_count", "Count words in text", textSchema("Text to count words in"), "Word count"),
    [](const JSONValue& args) {
        const std::size_t n = countWords(json::requireString(args, "text"));
        CallToolResult r = typed::textResult(std::to_string(n) + " words");
        JSONValue::Object sc;
        json::set(sc, "value", JSONValue{static_cast<int64_t>(n)});
        r.structuredContent = JSONValue{std::move(sc)};
        return r;
    });
}

} // namespace handlers
} // namespace mcpchain
