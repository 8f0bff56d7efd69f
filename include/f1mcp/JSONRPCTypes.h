//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model and JSON-RPC 2.0 message types for the F1 MCP server
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace f1mcp {

//==========================================================================================================
// JSONValue
// Purpose: JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: ordered map<string, shared_ptr<JSONValue>>; serialization emits keys in sorted order.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(int v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }

    // Member lookup on an Object; nullptr when this is not an object or the key is absent.
    const JSONValue* find(const std::string& key) const;
};

bool operator==(const JSONValue& a, const JSONValue& b);
inline bool operator!=(const JSONValue& a, const JSONValue& b) { return !(a == b); }

//==========================================================================================================
// JSON helpers
// Purpose: Small accessors used by handlers walking provider payloads. All return std::nullopt/nullptr on
//          type mismatch instead of throwing.
//==========================================================================================================
std::optional<std::string> getString(const JSONValue* v);
std::optional<int64_t> getInt(const JSONValue* v);
std::optional<double> getNumber(const JSONValue* v);
std::optional<bool> getBool(const JSONValue* v);
const JSONValue::Array* getArray(const JSONValue* v);

// Follows a path of object keys; nullptr when any step is missing.
const JSONValue* findPath(const JSONValue& root, std::initializer_list<const char*> path);

// Wraps a value into the shared_ptr form held by Array/Object.
template <typename T>
std::shared_ptr<JSONValue> makeJSON(T&& v) {
    return std::make_shared<JSONValue>(std::forward<T>(v));
}

//==========================================================================================================
// JsonParseError
// Purpose: Raised by parseJSON for malformed text; what() names the failure and byte offset.
//==========================================================================================================
class JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset_(offset) {}
    std::size_t offset() const noexcept { return offset_; }
private:
    std::size_t offset_;
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON text. Trailing non-whitespace, invalid escapes, bad numbers and nesting
//          deeper than 256 levels are rejected.
// Args:
//   text: UTF-8 JSON text.
// Returns:
//   Parsed JSONValue. Throws JsonParseError on malformed input.
//==========================================================================================================
JSONValue parseJSON(const std::string& text);

//==========================================================================================================
// serializeJSONValue / serializeJSONValuePretty
// Purpose: Compact single-line serialization (used on the wire) and indented serialization (used for
//          human-readable tool output).
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);
std::string serializeJSONValuePretty(const JSONValue& value, int indent = 2);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

std::string idToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCMessage
// Purpose: Abstract base for JSON-RPC 2.0 messages providing serialization.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";

    virtual ~JSONRPCMessage() = default;
    virtual std::string Serialize() const = 0;
};

//==========================================================================================================
// JSONRPCRequest
// Purpose: JSON-RPC 2.0 request. A null id marks a notification.
// Methods:
//   Serialize(): JSON string (id omitted for notifications).
//   IsNotification(): True when id is null.
//==========================================================================================================
class JSONRPCRequest : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::string method;
    std::optional<JSONValue> params;

    JSONRPCRequest() = default;
    JSONRPCRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt)
        : id(std::move(id)), method(std::move(method)), params(std::move(params)) {}

    std::string Serialize() const override;
    bool IsNotification() const { return std::holds_alternative<std::nullptr_t>(id); }
};

//==========================================================================================================
// JSONRPCResponse
// Purpose: JSON-RPC 2.0 response carrying exactly one of result or error.
// Ctors:
//   JSONRPCResponse(id, result): Success response with result set.
//   JSONRPCResponse(id, error, /*isError*/): Error response with error set.
//==========================================================================================================
class JSONRPCResponse : public JSONRPCMessage {
public:
    JSONRPCId id{nullptr};
    std::optional<JSONValue> result;
    std::optional<JSONValue> error;

    JSONRPCResponse() = default;
    JSONRPCResponse(JSONRPCId id, JSONValue result)
        : id(std::move(id)), result(std::move(result)) {}
    JSONRPCResponse(JSONRPCId id, JSONValue error, bool /*isError*/)
        : id(std::move(id)), error(std::move(error)) {}

    std::string Serialize() const override;

    bool IsError() const { return error.has_value(); }
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes used by the dispatcher.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                            const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// CreateErrorResponse
// Purpose: Wrap an error object into a JSONRPCResponse with the given id.
//==========================================================================================================
std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data = std::nullopt);

} // namespace f1mcp
