//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Validates tools/call arguments against a tool's declared inputSchema
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "f1mcp/JSONRPCTypes.h"
#include "f1mcp/errors/Errors.h"

namespace f1mcp {
namespace validation {

//==========================================================================================================
// validateArguments
// Purpose: Checks arguments against the subset of JSON Schema used by tool descriptors:
//            { type: "object", properties: { p: { type, enum? } }, required: [p...] }
//          Property types may be a single name or an array of names (integer, number, string, boolean,
//          object, array, null). A JSON null for an optional property counts as absent; for a required
//          property it counts as missing. Properties not declared in the schema are ignored.
// Args:
//   schema: Tool inputSchema. A null or non-object schema accepts any object.
//   arguments: Arguments object from tools/call.
// Returns:
//   std::nullopt when valid; otherwise the first violation (required fields are checked first, in declared
//   order, then properties in name order).
//==========================================================================================================
std::optional<errors::ValidationError> validateArguments(const JSONValue& schema, const JSONValue& arguments);

// True when value matches the JSON Schema primitive type name.
bool matchesType(const JSONValue& value, const std::string& typeName);

// Name of the JSON type of value ("integer" for whole numbers stored as int64).
std::string jsonTypeName(const JSONValue& value);

} // namespace validation
} // namespace f1mcp
