//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_dispatcher.cpp
// Purpose: GoogleTests for JSON-RPC envelope handling, routing and error translation in the Dispatcher
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "f1mcp/Dispatcher.h"
#include "f1mcp/errors/Errors.h"

using namespace f1mcp;

namespace {

std::shared_ptr<const Registries> makeRegistries(std::atomic<int>* calls = nullptr) {
    auto regs = std::make_shared<Registries>();
    regs->tools.Register(Tool("echo", "Echo a message", parseJSON(R"({
        "type":"object","properties":{"message":{"type":"string"}},"required":["message"]})")),
        [calls](const JSONValue& args) {
            if (calls) ++*calls;
            return JSONValue(getString(args.find("message")).value_or(""));
        });
    regs->tools.Register(Tool("lookup", "Structured result", parseJSON(R"({
        "type":"object","properties":{"year":{"type":"integer"}}})")),
        [](const JSONValue& args) {
            JSONValue::Object o;
            o["year"] = makeJSON(getInt(args.find("year")).value_or(0));
            return JSONValue(std::move(o));
        });
    regs->tools.Register(Tool("unavailable", "Always fails upstream"),
        [](const JSONValue&) -> JSONValue {
            FetchError fe;
            fe.kind = FetchErrorKind::Exhausted;
            fe.attempts = 3;
            fe.lastKind = FetchErrorKind::ServerError;
            fe.httpStatus = 503;
            throw errors::DataError(fe);
        });
    regs->tools.Register(Tool("broken", "Throws an unexpected exception"),
        [](const JSONValue&) -> JSONValue { throw std::runtime_error("unexpected"); });
    regs->tools.Register(Tool("opaque", "Throws a value that is not a std::exception"),
        [](const JSONValue&) -> JSONValue { throw 42; });
    regs->resources.Register(Resource("f1://drivers/current", "Drivers", std::nullopt, std::string("application/json")),
        [](const std::string& uri) {
            JSONValue::Object o;
            o["uri"] = makeJSON(uri);
            return JSONValue(std::move(o));
        });
    regs->Freeze();
    return regs;
}

class DispatcherTest : public ::testing::Test {
protected:
    std::atomic<int> calls{0};
    std::unique_ptr<Dispatcher> dispatcher;

    void SetUp() override {
        dispatcher = std::make_unique<Dispatcher>(makeRegistries(&calls), Implementation{"f1-data-server", "1.0.0"});
    }

    JSONValue call(const std::string& line) {
        auto out = dispatcher->Handle(line);
        EXPECT_TRUE(out.has_value()) << "no response for " << line;
        if (!out.has_value()) return JSONValue{};
        EXPECT_EQ(out->find('\n'), std::string::npos);
        return parseJSON(*out);
    }

    static int64_t errorCode(const JSONValue& resp) {
        return getInt(findPath(resp, {"error", "code"})).value_or(0);
    }
};

} // namespace

TEST_F(DispatcherTest, InitializeReportsCapabilitiesAndServerInfo) {
    EXPECT_FALSE(dispatcher->IsInitialized());
    JSONValue r = call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","clientInfo":{"name":"test"}}})");
    EXPECT_EQ(getInt(r.find("id")).value(), 1);
    EXPECT_EQ(getString(findPath(r, {"result", "protocolVersion"})).value(), PROTOCOL_VERSION);
    EXPECT_EQ(getString(findPath(r, {"result", "serverInfo", "name"})).value(), "f1-data-server");
    EXPECT_NE(findPath(r, {"result", "capabilities", "tools"}), nullptr);
    EXPECT_NE(findPath(r, {"result", "capabilities", "resources"}), nullptr);
    EXPECT_TRUE(dispatcher->IsInitialized());
}

TEST_F(DispatcherTest, ToolsListIsStableAndComplete) {
    const std::string req = R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})";
    JSONValue first = call(req);
    const auto* tools = getArray(findPath(first, {"result", "tools"}));
    ASSERT_NE(tools, nullptr);
    ASSERT_EQ(tools->size(), 5u);
    EXPECT_EQ(getString((*tools)[0]->find("name")).value(), "echo");
    EXPECT_EQ(getString((*tools)[3]->find("name")).value(), "broken");
    EXPECT_EQ(getString((*tools)[4]->find("name")).value(), "opaque");
    // Tools registered without a schema still advertise an object input
    EXPECT_EQ(getString(findPath(*(*tools)[2], {"inputSchema", "type"})).value(), "object");
    EXPECT_EQ(call(req), first);
}

TEST_F(DispatcherTest, ToolCallWrapsStringResultAsText) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":"a1","method":"tools/call","params":{"name":"echo","arguments":{"message":"box box"}}})");
    EXPECT_EQ(getString(r.find("id")).value(), "a1");
    const auto* content = getArray(findPath(r, {"result", "content"}));
    ASSERT_NE(content, nullptr);
    ASSERT_EQ(content->size(), 1u);
    EXPECT_EQ(getString((*content)[0]->find("type")).value(), "text");
    EXPECT_EQ(getString((*content)[0]->find("text")).value(), "box box");
    EXPECT_FALSE(getBool(findPath(r, {"result", "isError"})).value());
}

TEST_F(DispatcherTest, ToolCallSerializesStructuredResult) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"lookup","arguments":{"year":2023}}})");
    const auto* content = getArray(findPath(r, {"result", "content"}));
    ASSERT_NE(content, nullptr);
    JSONValue payload = parseJSON(getString((*content)[0]->find("text")).value());
    EXPECT_EQ(getInt(payload.find("year")).value(), 2023);
}

TEST_F(DispatcherTest, ToolCallWithoutArgumentsUsesEmptyObject) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"lookup"}})");
    EXPECT_EQ(r.find("error"), nullptr);
}

TEST_F(DispatcherTest, UnknownToolIsMethodNotFound) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"get_weather","arguments":{}}})");
    EXPECT_EQ(errorCode(r), -32601);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "tool"})).value(), "get_weather");
    EXPECT_EQ(getInt(r.find("id")).value(), 4);
}

TEST_F(DispatcherTest, MissingRequiredArgumentIsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"echo","arguments":{}}})");
    EXPECT_EQ(errorCode(r), -32602);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "field"})).value(), "message");
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(DispatcherTest, WrongArgumentTypeIsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{"name":"echo","arguments":{"message":42}}})");
    EXPECT_EQ(errorCode(r), -32602);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "field"})).value(), "message");
}

TEST_F(DispatcherTest, MissingToolNameIsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"arguments":{}}})");
    EXPECT_EQ(errorCode(r), -32602);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "field"})).value(), "name");
}

TEST_F(DispatcherTest, ProviderFailureIsInternalErrorWithKind) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"unavailable","arguments":{}}})");
    EXPECT_EQ(errorCode(r), -32603);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "kind"})).value(), "exhausted");
    EXPECT_EQ(getString(findPath(r, {"error", "data", "lastKind"})).value(), "server_error");
    EXPECT_EQ(getInt(findPath(r, {"error", "data", "httpStatus"})).value(), 503);
}

TEST_F(DispatcherTest, UnexpectedHandlerExceptionIsInternalError) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":9,"method":"tools/call","params":{"name":"broken","arguments":{}}})");
    EXPECT_EQ(errorCode(r), -32603);
    EXPECT_EQ(getInt(r.find("id")).value(), 9);
}

TEST_F(DispatcherTest, NonStandardHandlerExceptionIsInternalError) {
    std::optional<std::string> out;
    EXPECT_NO_THROW(out = dispatcher->Handle(
        R"({"jsonrpc":"2.0","id":19,"method":"tools/call","params":{"name":"opaque","arguments":{}}})"));
    ASSERT_TRUE(out.has_value());
    JSONValue r = parseJSON(*out);
    EXPECT_EQ(errorCode(r), -32603);
    EXPECT_EQ(getString(findPath(r, {"error", "message"})).value(), "Internal error");
    EXPECT_EQ(getInt(r.find("id")).value(), 19);

    // The dispatcher keeps serving after the failure
    JSONValue next = call(R"({"jsonrpc":"2.0","id":20,"method":"tools/call","params":{"name":"echo","arguments":{"message":"still here"}}})");
    EXPECT_EQ(next.find("error"), nullptr);
}

TEST_F(DispatcherTest, IntegerArgumentBeyondInt64IsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":21,"method":"tools/call","params":{"name":"lookup","arguments":{"year":1e300}}})");
    EXPECT_EQ(errorCode(r), -32602);
    EXPECT_EQ(getString(findPath(r, {"error", "data", "field"})).value(), "year");

    JSONValue whole = call(R"({"jsonrpc":"2.0","id":22,"method":"tools/call","params":{"name":"lookup","arguments":{"year":2023.0}}})");
    EXPECT_EQ(whole.find("error"), nullptr);
}

TEST_F(DispatcherTest, ResourcesListAndRead) {
    JSONValue list = call(R"({"jsonrpc":"2.0","id":10,"method":"resources/list"})");
    const auto* resources = getArray(findPath(list, {"result", "resources"}));
    ASSERT_NE(resources, nullptr);
    ASSERT_EQ(resources->size(), 1u);
    EXPECT_EQ(getString((*resources)[0]->find("uri")).value(), "f1://drivers/current");

    JSONValue read = call(R"({"jsonrpc":"2.0","id":11,"method":"resources/read","params":{"uri":"f1://drivers/current"}})");
    const auto* contents = getArray(findPath(read, {"result", "contents"}));
    ASSERT_NE(contents, nullptr);
    ASSERT_EQ(contents->size(), 1u);
    EXPECT_EQ(getString((*contents)[0]->find("mimeType")).value(), "application/json");
    JSONValue payload = parseJSON(getString((*contents)[0]->find("text")).value());
    EXPECT_EQ(getString(payload.find("uri")).value(), "f1://drivers/current");
}

TEST_F(DispatcherTest, UnknownResourceIsMethodNotFound) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":12,"method":"resources/read","params":{"uri":"f1://weather"}})");
    EXPECT_EQ(errorCode(r), -32601);
}

TEST_F(DispatcherTest, UnknownMethodIsMethodNotFound) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":13,"method":"prompts/list"})");
    EXPECT_EQ(errorCode(r), -32601);
}

TEST_F(DispatcherTest, MalformedJsonIsParseErrorWithNullId) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":14,"method":)");
    EXPECT_EQ(errorCode(r), -32700);
    ASSERT_NE(r.find("id"), nullptr);
    EXPECT_TRUE(r.find("id")->isNull());
}

TEST_F(DispatcherTest, BatchIsRejectedAsParseError) {
    JSONValue r = call(R"([{"jsonrpc":"2.0","id":1,"method":"tools/list"}])");
    EXPECT_EQ(errorCode(r), -32700);
}

TEST_F(DispatcherTest, UnsupportedIdTypeIsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":{"x":1},"method":"tools/list"})");
    EXPECT_EQ(errorCode(r), -32602);
    EXPECT_TRUE(r.find("id")->isNull());

    JSONValue fractional = call(R"({"jsonrpc":"2.0","id":1.5,"method":"tools/list"})");
    EXPECT_EQ(errorCode(fractional), -32602);
    EXPECT_TRUE(fractional.find("id")->isNull());
}

TEST_F(DispatcherTest, IntegralDoubleIdIsEchoedAsInteger) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":1.0,"method":"tools/list"})");
    EXPECT_EQ(r.find("error"), nullptr);
    ASSERT_NE(r.find("id"), nullptr);
    EXPECT_TRUE(std::holds_alternative<int64_t>(r.find("id")->value));
    EXPECT_EQ(getInt(r.find("id")).value(), 1);

    JSONValue huge = call(R"({"jsonrpc":"2.0","id":1e300,"method":"tools/list"})");
    EXPECT_EQ(errorCode(huge), -32602);
    EXPECT_TRUE(huge.find("id")->isNull());
}

TEST_F(DispatcherTest, NotificationsProduceNoOutput) {
    EXPECT_FALSE(dispatcher->Handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    // A tools/call without id is a notification and is not executed
    EXPECT_FALSE(dispatcher->Handle(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"echo","arguments":{"message":"x"}}})").has_value());
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(DispatcherTest, NonObjectParamsIsInvalidParams) {
    JSONValue r = call(R"({"jsonrpc":"2.0","id":15,"method":"tools/call","params":[1,2]})");
    EXPECT_EQ(errorCode(r), -32602);
}

TEST_F(DispatcherTest, ConcurrentCallsKeepTheirIds) {
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t, &mismatches]() {
            for (int i = 0; i < 25; ++i) {
                const int id = t * 100 + i;
                auto out = dispatcher->Handle(
                    "{\"jsonrpc\":\"2.0\",\"id\":" + std::to_string(id) +
                    ",\"method\":\"tools/call\",\"params\":{\"name\":\"echo\",\"arguments\":{\"message\":\"m" +
                    std::to_string(id) + "\"}}}");
                JSONValue r = parseJSON(out.value());
                const auto* content = getArray(findPath(r, {"result", "content"}));
                if (getInt(r.find("id")) != id || !content ||
                    getString((*content)[0]->find("text")) != "m" + std::to_string(id)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(mismatches.load(), 0);
    EXPECT_EQ(calls.load(), 200);
}

TEST(Dispatcher, RequiresFrozenRegistries) {
    auto regs = std::make_shared<Registries>();
    EXPECT_THROW({ Dispatcher d(regs, Implementation("x", "1")); }, std::logic_error);
    EXPECT_THROW({ Dispatcher d(nullptr, Implementation("x", "1")); }, std::invalid_argument);
}
