//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Tool argument validation against declared input schemas
//==========================================================================================================

#include "f1mcp/validation/SchemaValidator.h"

#include <vector>

namespace f1mcp {
namespace validation {

bool matchesType(const JSONValue& value, const std::string& typeName) {
    if (typeName == "integer") {
        // Whole doubles count only when they fit int64_t
        return getInt(&value).has_value();
    }
    if (typeName == "number") {
        return std::holds_alternative<int64_t>(value.value) || std::holds_alternative<double>(value.value);
    }
    if (typeName == "string") return std::holds_alternative<std::string>(value.value);
    if (typeName == "boolean") return std::holds_alternative<bool>(value.value);
    if (typeName == "object") return std::holds_alternative<JSONValue::Object>(value.value);
    if (typeName == "array") return std::holds_alternative<JSONValue::Array>(value.value);
    if (typeName == "null") return std::holds_alternative<std::nullptr_t>(value.value);
    // Unknown type names do not constrain the value
    return true;
}

std::string jsonTypeName(const JSONValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) return "null";
        else if constexpr (std::is_same_v<T, bool>) return "boolean";
        else if constexpr (std::is_same_v<T, int64_t>) return "integer";
        else if constexpr (std::is_same_v<T, double>) return "number";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else if constexpr (std::is_same_v<T, JSONValue::Array>) return "array";
        else return "object";
    }, value.value);
}

namespace {
// Declared type names of a property schema; empty when unconstrained.
std::vector<std::string> declaredTypes(const JSONValue& propSchema) {
    std::vector<std::string> types;
    const JSONValue* t = propSchema.find("type");
    if (auto s = getString(t)) {
        types.push_back(*s);
    } else if (const auto* arr = getArray(t)) {
        for (const auto& item : *arr) {
            if (auto name = getString(item.get())) types.push_back(*name);
        }
    }
    return types;
}

std::string joinTypes(const std::vector<std::string>& types) {
    std::string out;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) out += (i + 1 == types.size()) ? " or " : ", ";
        out += types[i];
    }
    return out;
}
} // namespace

std::optional<errors::ValidationError> validateArguments(const JSONValue& schema, const JSONValue& arguments) {
    if (!arguments.isObject()) {
        return errors::ValidationError("arguments", "Invalid params: arguments must be an object", "object");
    }
    if (!schema.isObject()) {
        return std::nullopt;
    }

    if (const auto* required = getArray(schema.find("required"))) {
        for (const auto& item : *required) {
            auto name = getString(item.get());
            if (!name) continue;
            const JSONValue* v = arguments.find(*name);
            if (v == nullptr || v->isNull()) {
                return errors::ValidationError(*name, "Missing required argument: " + *name);
            }
        }
    }

    const JSONValue* props = schema.find("properties");
    if (props == nullptr || !props->isObject()) {
        return std::nullopt;
    }
    for (const auto& [name, propSchema] : std::get<JSONValue::Object>(props->value)) {
        if (!propSchema) continue;
        const JSONValue* v = arguments.find(name);
        if (v == nullptr || v->isNull()) continue;

        const auto types = declaredTypes(*propSchema);
        if (!types.empty()) {
            bool ok = false;
            for (const auto& t : types) {
                if (matchesType(*v, t)) { ok = true; break; }
            }
            if (!ok) {
                const std::string expected = joinTypes(types);
                return errors::ValidationError(name,
                    "Invalid type for argument '" + name + "': expected " + expected + ", got " + jsonTypeName(*v),
                    expected);
            }
        }

        if (const auto* allowed = getArray(propSchema->find("enum"))) {
            bool found = false;
            for (const auto& option : *allowed) {
                if (option && *option == *v) { found = true; break; }
            }
            if (!found) {
                std::string expected = "one of ";
                for (std::size_t i = 0; i < allowed->size(); ++i) {
                    if (i > 0) expected += ", ";
                    expected += (*allowed)[i] ? serializeJSONValue(*(*allowed)[i]) : std::string("null");
                }
                return errors::ValidationError(name, "Invalid value for argument '" + name + "'", expected);
            }
        }
    }
    return std::nullopt;
}

} // namespace validation
} // namespace f1mcp
