//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, handler exceptions and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "f1mcp/JSONRPCTypes.h"
#include "f1mcp/errors/FetchError.h"

namespace f1mcp {
namespace errors {

// Categorization of the JSON-RPC error codes the server emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation handed to the response writer.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
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
        default: return ErrorCategory::Unknown;
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

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// DataError
// Purpose: Thrown by tool and resource handlers when data cannot be produced (provider failure, unknown
//          event, unsupported session). Translated to -32603.
//==========================================================================================================
class DataError : public std::runtime_error {
public:
    explicit DataError(const std::string& message)
        : std::runtime_error(message) {}
    explicit DataError(FetchError fetch)
        : std::runtime_error(fetch.describe()), fetch_(std::move(fetch)) {}

    const std::optional<FetchError>& fetchError() const noexcept { return fetch_; }

private:
    std::optional<FetchError> fetch_;
};

//==========================================================================================================
// ValidationError
// Purpose: Argument failed the tool input schema. Translated to -32602 with data { field, expected? }.
//==========================================================================================================
class ValidationError : public std::invalid_argument {
public:
    ValidationError(std::string field, const std::string& message, std::string expected = std::string())
        : std::invalid_argument(message), field_(std::move(field)), expected_(std::move(expected)) {}

    const std::string& field() const noexcept { return field_; }
    const std::string& expected() const noexcept { return expected_; }

private:
    std::string field_;
    std::string expected_;
};

//==========================================================================================================
// Error translation
// Purpose: Single place mapping internal failures to JSON-RPC error objects.
//   parseError          -> -32700
//   methodNotFound      -> -32601 (unknown method, tool or resource)
//   invalidParams       -> -32602 (data.field names the offending field)
//   fromValidation      -> -32602
//   fromFetchError      -> -32603 (data carries kind/httpStatus/attempts)
//   fromException       -> -32603 (DataError and ValidationError are recognized)
//==========================================================================================================
McpError parseError(const std::string& detail);
McpError methodNotFound(const std::string& what, const std::string& name);
McpError invalidParams(const std::string& message, const std::string& field = std::string());
McpError fromValidation(const ValidationError& e);
McpError fromFetchError(const FetchError& e);
McpError fromException(const std::exception& e);

} // namespace errors
} // namespace f1mcp
