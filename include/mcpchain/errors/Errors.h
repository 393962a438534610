//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exceptions and JSON-RPC error mapping helpers for the handler chain
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "mcpchain/JSONRPCTypes.h"

namespace mcpchain {
namespace errors {

// Categorization of the JSON-RPC and chain error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    DownstreamError,
    DownstreamToolMissing,
    Unknown
};

// Typed error representation used across the chain.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or chain-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::DownstreamError: return ErrorCategory::DownstreamError;
        case JSONRPCErrorCodes::DownstreamToolMissing: return ErrorCategory::DownstreamToolMissing;
        default: return ErrorCategory::Unknown;
    }
}

inline const char* toString(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::JsonRpcParse: return "ParseError";
        case ErrorCategory::JsonRpcInvalidRequest: return "InvalidRequest";
        case ErrorCategory::JsonRpcMethodNotFound: return "MethodNotFound";
        case ErrorCategory::JsonRpcInvalidParams: return "InvalidParams";
        case ErrorCategory::JsonRpcInternal: return "Internal";
        case ErrorCategory::DownstreamError: return "DownstreamError";
        case ErrorCategory::DownstreamToolMissing: return "DownstreamToolMissing";
        case ErrorCategory::Unknown:
        default: return "Unknown";
    }
}

inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }
    return makeError(static_cast<int>(std::get<int64_t>(itCode->second->value)),
                     std::get<std::string>(itMsg->second->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// Error constructors for the chain taxonomy
//==========================================================================================================
inline McpError invalidParams(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::InvalidParams, "Invalid params: " + detail);
}

inline McpError internalError(const std::string& detail) {
    return makeError(JSONRPCErrorCodes::InternalError, "Internal error: " + detail);
}

//==========================================================================================================
// ChainCompositionError
// Purpose: Raised by ChainBuilder when an ordered handler list cannot form a valid pipeline.
//==========================================================================================================
class ChainCompositionError : public std::runtime_error {
public:
    explicit ChainCompositionError(const std::string& what) : std::runtime_error(what) {}
};

//==========================================================================================================
// DownstreamCallError
// Purpose: Carries a typed McpError out of a nested call so a middleware's caller receives it verbatim.
//==========================================================================================================
class DownstreamCallError : public std::runtime_error {
public:
    explicit DownstreamCallError(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

} // namespace errors
} // namespace mcpchain
