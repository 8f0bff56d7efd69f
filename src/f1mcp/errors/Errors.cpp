//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: FetchError classification helpers and JSON-RPC error translation
//==========================================================================================================

#include <cctype>

#include "f1mcp/errors/Errors.h"
#include "logging/Logger.h"

namespace f1mcp {

const char* toString(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Network: return "network";
        case FetchErrorKind::AttemptTimeout: return "attempt_timeout";
        case FetchErrorKind::RateLimited: return "rate_limited";
        case FetchErrorKind::ServerError: return "server_error";
        case FetchErrorKind::ClientError: return "client_error";
        case FetchErrorKind::Malformed: return "malformed";
        case FetchErrorKind::SchemaMismatch: return "schema_mismatch";
        case FetchErrorKind::Timeout: return "timeout";
        case FetchErrorKind::Exhausted: return "exhausted";
        case FetchErrorKind::Internal: return "internal";
    }
    return "unknown";
}

bool IsTransient(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::Network:
        case FetchErrorKind::AttemptTimeout:
        case FetchErrorKind::RateLimited:
        case FetchErrorKind::ServerError:
            return true;
        default:
            return false;
    }
}

std::string FetchError::describe() const {
    std::string s = std::string("Data provider error (") + toString(kind) + ")";
    if (httpStatus.has_value()) s += " HTTP " + std::to_string(httpStatus.value());
    if (lastKind.has_value()) s += std::string(", last failure ") + toString(lastKind.value());
    if (attempts > 0) s += " after " + std::to_string(attempts) + (attempts == 1 ? " attempt" : " attempts");
    if (!message.empty()) s += ": " + message;
    return s;
}

namespace errors {

McpError parseError(const std::string& detail) {
    JSONValue::Object data;
    data["detail"] = makeJSON(detail);
    return makeError(JSONRPCErrorCodes::ParseError, "Parse error", JSONValue{std::move(data)});
}

McpError methodNotFound(const std::string& what, const std::string& name) {
    JSONValue::Object data;
    data[what] = makeJSON(name);
    std::string label = what;
    if (!label.empty()) label[0] = static_cast<char>(::toupper(static_cast<unsigned char>(label[0])));
    return makeError(JSONRPCErrorCodes::MethodNotFound, label + " not found: " + name, JSONValue{std::move(data)});
}

McpError invalidParams(const std::string& message, const std::string& field) {
    if (field.empty()) {
        return makeError(JSONRPCErrorCodes::InvalidParams, message);
    }
    JSONValue::Object data;
    data["field"] = makeJSON(field);
    return makeError(JSONRPCErrorCodes::InvalidParams, message, JSONValue{std::move(data)});
}

McpError fromValidation(const ValidationError& e) {
    JSONValue::Object data;
    data["field"] = makeJSON(e.field());
    if (!e.expected().empty()) data["expected"] = makeJSON(e.expected());
    return makeError(JSONRPCErrorCodes::InvalidParams, e.what(), JSONValue{std::move(data)});
}

McpError fromFetchError(const FetchError& e) {
    JSONValue::Object data;
    data["kind"] = makeJSON(toString(e.kind));
    if (e.httpStatus.has_value()) data["httpStatus"] = makeJSON(static_cast<int64_t>(e.httpStatus.value()));
    if (e.attempts > 0) data["attempts"] = makeJSON(static_cast<int64_t>(e.attempts));
    if (e.lastKind.has_value()) data["lastKind"] = makeJSON(toString(e.lastKind.value()));
    return makeError(JSONRPCErrorCodes::InternalError, e.describe(), JSONValue{std::move(data)});
}

McpError fromException(const std::exception& e) {
    if (const auto* ve = dynamic_cast<const ValidationError*>(&e)) {
        return fromValidation(*ve);
    }
    if (const auto* de = dynamic_cast<const DataError*>(&e)) {
        if (de->fetchError().has_value()) {
            return fromFetchError(de->fetchError().value());
        }
        return makeError(JSONRPCErrorCodes::InternalError, de->what());
    }
    LOG_ERROR("Unexpected handler failure: {}", e.what());
    return makeError(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
}

} // namespace errors
} // namespace f1mcp
