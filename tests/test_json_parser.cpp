//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_parser.cpp
// Purpose: GoogleTests for the strict JSON parser, serializers and JSON-RPC message serialization
//==========================================================================================================

#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include <string>

#include "f1mcp/JSONRPCTypes.h"

using namespace f1mcp;

TEST(JsonParser, ParsesNestedDocument) {
    JSONValue v = parseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":"d"}})");
    ASSERT_TRUE(v.isObject());
    const auto* arr = getArray(v.find("a"));
    ASSERT_NE(arr, nullptr);
    ASSERT_EQ(arr->size(), 5u);
    EXPECT_EQ(getInt((*arr)[0].get()).value(), 1);
    EXPECT_DOUBLE_EQ(getNumber((*arr)[1].get()).value(), 2.5);
    EXPECT_EQ(getString((*arr)[2].get()).value(), "x");
    EXPECT_TRUE(getBool((*arr)[3].get()).value());
    EXPECT_TRUE((*arr)[4]->isNull());
    EXPECT_EQ(getString(findPath(v, {"b", "c"})).value(), "d");
    EXPECT_EQ(findPath(v, {"b", "missing"}), nullptr);
}

TEST(JsonParser, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = parseJSON(R"("line\nquote\" \u00e9 \ud83c\udfc1")");
    EXPECT_EQ(getString(&v).value(), "line\nquote\" \xC3\xA9 \xF0\x9F\x8F\x81");
    EXPECT_THROW(parseJSON(R"("\ud83c alone")"), JsonParseError);
}

TEST(JsonParser, RejectsMalformedInput) {
    EXPECT_THROW(parseJSON(""), JsonParseError);
    EXPECT_THROW(parseJSON("{"), JsonParseError);
    EXPECT_THROW(parseJSON(R"({"a":1,})"), JsonParseError);
    EXPECT_THROW(parseJSON(R"({"a":1} trailing)"), JsonParseError);
    EXPECT_THROW(parseJSON(R"("bad \q escape")"), JsonParseError);
    EXPECT_THROW(parseJSON("01"), JsonParseError);
    EXPECT_THROW(parseJSON("tru"), JsonParseError);
}

TEST(JsonParser, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(parseJSON(deep), JsonParseError);

    std::string ok(100, '[');
    ok += std::string(100, ']');
    EXPECT_NO_THROW(parseJSON(ok));
}

TEST(JsonParser, CompactSerializationIsStable) {
    JSONValue v = parseJSON(R"({"z":1,"a":"s","m":[true,null]})");
    // Keys are emitted in sorted order
    EXPECT_EQ(serializeJSONValue(v), R"({"a":"s","m":[true,null],"z":1})");
    EXPECT_EQ(parseJSON(serializeJSONValue(v)), v);
}

TEST(JsonParser, PrettySerializationParsesBack) {
    JSONValue v = parseJSON(R"({"drivers":[{"code":"VER"},{"code":"HAM"}],"count":2})");
    const std::string pretty = serializeJSONValuePretty(v);
    EXPECT_NE(pretty.find('\n'), std::string::npos);
    EXPECT_EQ(parseJSON(pretty), v);
}

TEST(JsonParser, IntegerAndDoubleCompareNumerically) {
    EXPECT_EQ(JSONValue(int64_t{3}), JSONValue(3.0));
    EXPECT_NE(JSONValue(int64_t{3}), JSONValue(3.5));
    EXPECT_NE(JSONValue("3"), JSONValue(int64_t{3}));
}

TEST(JsonParser, GetIntRejectsDoublesOutsideInt64) {
    JSONValue v = parseJSON(R"({"big":1e300,"small":-1e300,"edge":9223372036854775808.0,"low":-9223372036854775808.0,"whole":2023.0})");
    EXPECT_FALSE(getInt(v.find("big")).has_value());
    EXPECT_FALSE(getInt(v.find("small")).has_value());
    EXPECT_FALSE(getInt(v.find("edge")).has_value());
    EXPECT_EQ(getInt(v.find("low")).value(), std::numeric_limits<int64_t>::min());
    EXPECT_EQ(getInt(v.find("whole")).value(), 2023);
    // Integer literals beyond int64 degrade to double and stay unreadable as integers
    JSONValue huge = parseJSON("18446744073709551616");
    EXPECT_FALSE(getInt(&huge).has_value());
}

TEST(JsonRpcTypes, NotificationOmitsId) {
    JSONRPCRequest note;
    note.method = "notifications/initialized";
    EXPECT_TRUE(note.IsNotification());
    JSONValue v = parseJSON(note.Serialize());
    EXPECT_EQ(v.find("id"), nullptr);
    EXPECT_EQ(getString(v.find("method")).value(), "notifications/initialized");
}

TEST(JsonRpcTypes, ErrorResponseShape) {
    auto resp = CreateErrorResponse(JSONRPCId{int64_t{7}}, JSONRPCErrorCodes::MethodNotFound, "nope");
    JSONValue v = parseJSON(resp->Serialize());
    EXPECT_EQ(getString(v.find("jsonrpc")).value(), "2.0");
    EXPECT_EQ(getInt(v.find("id")).value(), 7);
    EXPECT_EQ(getInt(findPath(v, {"error", "code"})).value(), -32601);
    EXPECT_EQ(getString(findPath(v, {"error", "message"})).value(), "nope");
    EXPECT_EQ(v.find("result"), nullptr);
}

TEST(JsonRpcTypes, StringIdRoundTripsThroughResponse) {
    JSONRPCResponse resp(JSONRPCId{std::string("abc")}, JSONValue(true));
    JSONValue v = parseJSON(resp.Serialize());
    EXPECT_EQ(getString(v.find("id")).value(), "abc");
    EXPECT_TRUE(getBool(v.find("result")).value());
}
