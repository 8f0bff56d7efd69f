//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_validator.cpp
// Purpose: GoogleTests for tools/call argument validation against input schemas
//==========================================================================================================

#include <gtest/gtest.h>

#include "f1mcp/JSONRPCTypes.h"
#include "f1mcp/validation/SchemaValidator.h"

using namespace f1mcp;
using f1mcp::validation::validateArguments;

namespace {
const JSONValue kSchema = parseJSON(R"({
    "type": "object",
    "properties": {
        "year": {"type": "integer"},
        "gp": {"type": ["string", "integer"]},
        "session": {"type": "string", "enum": ["Q", "R"]},
        "verbose": {"type": "boolean"}
    },
    "required": ["year", "gp"]
})");
}

TEST(SchemaValidator, AcceptsValidArguments) {
    EXPECT_FALSE(validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":"Monza"})")).has_value());
    EXPECT_FALSE(validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":14,"session":"R"})")).has_value());
}

TEST(SchemaValidator, MissingRequiredNamesField) {
    auto v = validateArguments(kSchema, parseJSON(R"({"gp":"Monza"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "year");
    EXPECT_EQ(std::string(v->what()), "Missing required argument: year");
}

TEST(SchemaValidator, NullCountsAsMissingForRequired) {
    auto v = validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":null})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "gp");
}

TEST(SchemaValidator, RequiredCheckedBeforeTypes) {
    // verbose has the wrong type, but the missing gp is reported first
    auto v = validateArguments(kSchema, parseJSON(R"({"year":2024,"verbose":"yes"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "gp");
}

TEST(SchemaValidator, WrongPrimitiveType) {
    auto v = validateArguments(kSchema, parseJSON(R"({"year":"2024","gp":"Monza"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "year");
    EXPECT_EQ(v->expected(), "integer");
}

TEST(SchemaValidator, IntegerAcceptsWholeDoubles) {
    EXPECT_FALSE(validateArguments(kSchema, parseJSON(R"({"year":2024.0,"gp":"Monza"})")).has_value());
    auto v = validateArguments(kSchema, parseJSON(R"({"year":2024.5,"gp":"Monza"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "year");
}

TEST(SchemaValidator, IntegerRejectsValuesBeyondInt64) {
    auto v = validateArguments(kSchema, parseJSON(R"({"year":1e300,"gp":"Monza"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "year");
    EXPECT_EQ(v->expected(), "integer");

    // Union members get the same bound
    v = validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":-1e300})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "gp");
}

TEST(SchemaValidator, UnionTypeReportsAlternatives) {
    auto v = validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":true})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "gp");
    EXPECT_EQ(v->expected(), "string or integer");
}

TEST(SchemaValidator, EnumViolation) {
    auto v = validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":1,"session":"FP1"})"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "session");
}

TEST(SchemaValidator, UndeclaredPropertiesIgnored) {
    EXPECT_FALSE(validateArguments(kSchema, parseJSON(R"({"year":2024,"gp":1,"extra":[1,2]})")).has_value());
}

TEST(SchemaValidator, ArgumentsMustBeObject) {
    auto v = validateArguments(kSchema, parseJSON("[1,2]"));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->field(), "arguments");
}

TEST(SchemaValidator, NullSchemaAcceptsAnyObject) {
    EXPECT_FALSE(validateArguments(JSONValue{}, parseJSON(R"({"anything":1})")).has_value());
}
