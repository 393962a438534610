//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Recursive-descent JSON parser, canonical serializer and JSON-RPC message codecs
//==========================================================================================================

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include "mcpchain/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace mcpchain {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

bool JSONValue::operator==(const JSONValue& other) const {
    // Numbers compare by value regardless of integer/double representation
    if (isNumber() && other.isNumber()) {
        auto asDouble = [](const JSONValue& v) {
            if (std::holds_alternative<int64_t>(v.value)) return static_cast<double>(std::get<int64_t>(v.value));
            return std::get<double>(v.value);
        };
        if (std::holds_alternative<int64_t>(value) && std::holds_alternative<int64_t>(other.value)) {
            return std::get<int64_t>(value) == std::get<int64_t>(other.value);
        }
        return asDouble(*this) == asDouble(other);
    }
    if (value.index() != other.value.index()) return false;
    if (isArray()) {
        const auto& a = std::get<Array>(value);
        const auto& b = std::get<Array>(other.value);
        if (a.size() != b.size()) return false;
        for (std::size_t k = 0; k < a.size(); ++k) {
            const bool an = !a[k] || a[k]->isNull();
            const bool bn = !b[k] || b[k]->isNull();
            if (an || bn) { if (an != bn) return false; continue; }
            if (*a[k] != *b[k]) return false;
        }
        return true;
    }
    if (isObject()) {
        const auto& a = std::get<Object>(value);
        const auto& b = std::get<Object>(other.value);
        if (a.size() != b.size()) return false;
        for (const auto& [k, v] : a) {
            auto it = b.find(k);
            if (it == b.end()) return false;
            const bool an = !v || v->isNull();
            const bool bn = !it->second || it->second->isNull();
            if (an || bn) { if (an != bn) return false; continue; }
            if (*v != *it->second) return false;
        }
        return true;
    }
    return value == other.value;
}

// -------------------------------
// Recursive JSON parser
// -------------------------------
namespace {
struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};
    static constexpr int kMaxDepth = 256;

    explicit JsonParser(const std::string& str) : s(str) {}

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) throw std::runtime_error("Invalid unicode escape");
        unsigned int code = 0;
        for (int k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else throw std::runtime_error("Invalid hex in unicode escape");
        }
        return code;
    }

    static void appendUtf8(std::string& out, unsigned int code) {
        if (code <= 0x7F) {
            out.push_back(static_cast<char>(code));
        } else if (code <= 0x7FF) {
            out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else if (code <= 0xFFFF) {
            out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
        }
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') throw std::runtime_error("Expected '\"' at string start");
        ++i;
        std::string out;
        while (true) {
            if (i >= s.size()) throw std::runtime_error("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (static_cast<unsigned char>(c) < 0x20) throw std::runtime_error("Control character in string");
            if (c != '\\') { out.push_back(c); continue; }
            if (i >= s.size()) throw std::runtime_error("Invalid escape");
            char e = s[i++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned int code = parseHex4();
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // Surrogate pair
                        if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                            i += 2;
                            unsigned int low = parseHex4();
                            if (low < 0xDC00 || low > 0xDFFF) throw std::runtime_error("Invalid low surrogate");
                            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            throw std::runtime_error("Unpaired high surrogate");
                        }
                    }
                    appendUtf8(out, code);
                    break;
                }
                default: throw std::runtime_error("Unknown escape");
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t intStart = i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
        if (i == intStart) throw std::runtime_error("Invalid number");
        if (s[intStart] == '0' && i - intStart > 1) throw std::runtime_error("Leading zero in number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            std::size_t fracStart = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
            if (i == fracStart) throw std::runtime_error("Invalid fraction");
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            std::size_t expStart = i;
            while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
            if (i == expStart) throw std::runtime_error("Invalid exponent");
        }
        const char* first = s.data() + start;
        const char* last = s.data() + i;
        if (!isFloat) {
            int64_t v = 0;
            auto [ptr, ec] = std::from_chars(first, last, v);
            if (ec == std::errc() && ptr == last) return JSONValue(v);
            // Out of int64 range: fall through to double
        }
        double d = 0.0;
        auto [ptr, ec] = std::from_chars(first, last, d);
        if (ec != std::errc() || ptr != last) throw std::runtime_error("Number out of range");
        return JSONValue(d);
    }

    JSONValue parseArray() {
        if (!match('[')) throw std::runtime_error("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) throw std::runtime_error("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) throw std::runtime_error("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) throw std::runtime_error("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) throw std::runtime_error("Unexpected end of JSON");
        if (++depth > kMaxDepth) throw std::runtime_error("JSON nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') out = JSONValue(parseString());
        else if (c == '{') out = parseObject();
        else if (c == '[') out = parseArray();
        else if (s.compare(i, 4, "true") == 0) { i += 4; out = JSONValue(true); }
        else if (s.compare(i, 5, "false") == 0) { i += 5; out = JSONValue(false); }
        else if (s.compare(i, 4, "null") == 0) { i += 4; out = JSONValue(nullptr); }
        else if (c == '-' || (c >= '0' && c <= '9')) out = parseNumber();
        else throw std::runtime_error(std::string("Unexpected character '") + c + "'");
        --depth;
        return out;
    }
};

void appendEscaped(std::string& out, const std::string& v) {
    out.push_back('"');
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendDouble(std::string& out, double v) {
    if (!std::isfinite(v)) { out += "null"; return; }
    // Shortest representation that round-trips (2.0 -> "2", 0.1 -> "0.1")
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) { out += "null"; return; }
    out.append(buf, ptr);
}

void serializeInto(std::string& out, const JSONValue& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            out += std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            appendDouble(out, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            appendEscaped(out, v);
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            out.push_back('[');
            for (std::size_t k = 0; k < v.size(); ++k) {
                if (k > 0) out.push_back(',');
                if (v[k]) serializeInto(out, *v[k]); else out += "null";
            }
            out.push_back(']');
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::vector<const std::string*> keys;
            keys.reserve(v.size());
            for (const auto& kv : v) keys.push_back(&kv.first);
            std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });
            out.push_back('{');
            bool first = true;
            for (const std::string* k : keys) {
                if (!first) out.push_back(',');
                first = false;
                appendEscaped(out, *k);
                out.push_back(':');
                const auto& child = v.at(*k);
                if (child) serializeInto(out, *child); else out += "null";
            }
            out.push_back('}');
        }
    }, value.get());
}

bool parseId(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (v.isNull()) { out = nullptr; return true; }
    return false;
}

JSONValue idToValue(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) return JSONValue(v);
        else if constexpr (std::is_same_v<T, int64_t>) return JSONValue(v);
        else return JSONValue(nullptr);
    }, id);
}

const JSONValue* field(const JSONValue::Object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

bool readVersion(const JSONValue::Object& o, std::string& jsonrpc) {
    const JSONValue* v = field(o, "jsonrpc");
    if (!v || !v->isString()) return false;
    jsonrpc = std::get<std::string>(v->value);
    return jsonrpc == "2.0";
}
} // namespace

//==========================================================================================================
// ParseJSON / SerializeJSON
//==========================================================================================================
JSONValue ParseJSON(const std::string& json) {
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        throw std::runtime_error("Trailing characters after JSON document");
    }
    return v;
}

std::string SerializeJSON(const JSONValue& value) {
    std::string out;
    serializeInto(out, value);
    return out;
}

std::string IdToString(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) return v;
        else if constexpr (std::is_same_v<T, int64_t>) return std::to_string(v);
        else return "null";
    }, id);
}

//==========================================================================================================
// JSONRPCRequest
//==========================================================================================================
JSONValue JSONRPCRequest::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToValue(id));
    o["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(o));
}

std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToValue());
}

bool JSONRPCRequest::FromValue(const JSONValue& value) {
    if (!value.isObject()) return false;
    const auto& o = std::get<JSONValue::Object>(value.value);
    if (!readVersion(o, jsonrpc)) return false;
    const JSONValue* m = field(o, "method");
    if (!m || !m->isString()) return false;
    const JSONValue* idv = field(o, "id");
    if (!idv || !parseId(*idv, id)) return false;
    method = std::get<std::string>(m->value);
    const JSONValue* p = field(o, "params");
    if (p) params = *p; else params.reset();
    return !method.empty();
}

bool JSONRPCRequest::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCRequest: {}", e.what());
        return false;
    }
}

//==========================================================================================================
// JSONRPCResponse
//==========================================================================================================
JSONValue JSONRPCResponse::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["id"] = std::make_shared<JSONValue>(idToValue(id));
    if (error.has_value()) {
        o["error"] = std::make_shared<JSONValue>(error.value());
    } else {
        o["result"] = std::make_shared<JSONValue>(result.has_value() ? result.value() : JSONValue(nullptr));
    }
    return JSONValue(std::move(o));
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToValue());
}

bool JSONRPCResponse::FromValue(const JSONValue& value) {
    if (!value.isObject()) return false;
    const auto& o = std::get<JSONValue::Object>(value.value);
    if (!readVersion(o, jsonrpc)) return false;
    const JSONValue* idv = field(o, "id");
    if (!idv || !parseId(*idv, id)) return false;
    const JSONValue* r = field(o, "result");
    const JSONValue* e = field(o, "error");
    if (o.find("result") != o.end() && !r) r = nullptr;
    if (e && r) return false;
    if (e) {
        if (!e->isObject()) return false;
        error = *e;
        result.reset();
        return true;
    }
    if (o.find("result") == o.end()) return false;
    error.reset();
    result = r ? *r : JSONValue(nullptr);
    return true;
}

bool JSONRPCResponse::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCResponse: {}", e.what());
        return false;
    }
}

//==========================================================================================================
// JSONRPCNotification
//==========================================================================================================
JSONValue JSONRPCNotification::ToValue() const {
    JSONValue::Object o;
    o["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    o["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        o["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(o));
}

std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToValue());
}

bool JSONRPCNotification::FromValue(const JSONValue& value) {
    if (!value.isObject()) return false;
    const auto& o = std::get<JSONValue::Object>(value.value);
    if (!readVersion(o, jsonrpc)) return false;
    if (o.find("id") != o.end()) return false;
    const JSONValue* m = field(o, "method");
    if (!m || !m->isString()) return false;
    method = std::get<std::string>(m->value);
    const JSONValue* p = field(o, "params");
    if (p) params = *p; else params.reset();
    return !method.empty();
}

bool JSONRPCNotification::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    try {
        return FromValue(ParseJSON(json));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to deserialize JSONRPCNotification: {}", e.what());
        return false;
    }
}

//==========================================================================================================
// Error helpers
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message, const std::optional<JSONValue>& data) {
    JSONValue::Object o;
    o["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    o["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        o["data"] = std::make_shared<JSONValue>(data.value());
    }
    return JSONValue(std::move(o));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                                     const std::optional<JSONValue>& data) {
    return std::make_unique<JSONRPCResponse>(id, CreateErrorObject(code, message, data), true);
}

std::unique_ptr<JSONRPCResponse> CreateResultResponse(const JSONRPCId& id, JSONValue result) {
    return std::make_unique<JSONRPCResponse>(id, std::move(result));
}

} // namespace mcpchain
