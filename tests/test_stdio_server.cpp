//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_server.cpp
// Purpose: GoogleTests for line framing, ordering and pooled serving in StdioServer
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "f1mcp/StdioServer.hpp"

using namespace f1mcp;

namespace {

std::shared_ptr<Dispatcher> makeDispatcher() {
    auto regs = std::make_shared<Registries>();
    regs->tools.Register(Tool("echo", "Echo a message"), [](const JSONValue& args) {
        return JSONValue(getString(args.find("message")).value_or(""));
    });
    regs->tools.Register(Tool("slow", "Sleeps before answering"), [](const JSONValue& args) {
        std::this_thread::sleep_for(std::chrono::milliseconds(getInt(args.find("ms")).value_or(0)));
        return JSONValue("done");
    });
    regs->Freeze();
    return std::make_shared<Dispatcher>(regs, Implementation{"f1-data-server", "test"});
}

std::vector<JSONValue> responses(const std::string& output) {
    std::vector<JSONValue> out;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        out.push_back(parseJSON(line));
    }
    return out;
}

std::string echoCall(int id, const std::string& message) {
    return R"({"jsonrpc":"2.0","id":)" + std::to_string(id) +
           R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":")" + message + R"("}}})";
}

} // namespace

TEST(StdioServer, SequentialModeAnswersInOrder) {
    std::istringstream in(echoCall(1, "a") + "\n" + echoCall(2, "b") + "\n" + echoCall(3, "c") + "\n");
    std::ostringstream out;
    StdioServer server(makeDispatcher());
    EXPECT_EQ(server.Run(in, out), 3u);
    auto rs = responses(out.str());
    ASSERT_EQ(rs.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(getInt(rs[i].find("id")).value_or(0), i + 1);
    }
}

TEST(StdioServer, SkipsBlankLinesAndStripsCarriageReturn) {
    std::istringstream in("\n   \n\t\r\n" + echoCall(7, "crlf") + "\r\n\n");
    std::ostringstream out;
    StdioServer server(makeDispatcher());
    EXPECT_EQ(server.Run(in, out), 1u);
    auto rs = responses(out.str());
    ASSERT_EQ(rs.size(), 1u);
    EXPECT_EQ(getInt(rs[0].find("id")).value_or(0), 7);
    EXPECT_NE(rs[0].find("result"), nullptr);
}

TEST(StdioServer, NotificationsAreSilent) {
    std::istringstream in(std::string(R"({"jsonrpc":"2.0","method":"notifications/initialized"})") + "\n" +
                          echoCall(1, "x") + "\n");
    std::ostringstream out;
    StdioServer server(makeDispatcher());
    EXPECT_EQ(server.Run(in, out), 2u);
    EXPECT_EQ(responses(out.str()).size(), 1u);
}

TEST(StdioServer, MalformedLineGetsParseErrorAndServingContinues) {
    std::istringstream in("{not json\n" + echoCall(2, "after") + "\n");
    std::ostringstream out;
    StdioServer server(makeDispatcher());
    server.Run(in, out);
    auto rs = responses(out.str());
    ASSERT_EQ(rs.size(), 2u);
    EXPECT_EQ(getInt(findPath(rs[0], {"error", "code"})).value_or(0), -32700);
    EXPECT_TRUE(rs[0].find("id")->isNull());
    EXPECT_EQ(getInt(rs[1].find("id")).value_or(0), 2);
}

TEST(StdioServer, OversizeLineIsRejectedWithoutParsing) {
    StdioServerOptions opts;
    opts.maxLineBytes = 160;
    std::istringstream in(echoCall(1, std::string(200, 'x')) + "\n" + echoCall(2, "ok") + "\n");
    std::ostringstream out;
    StdioServer server(makeDispatcher(), opts);
    EXPECT_EQ(server.Run(in, out), 2u);
    auto rs = responses(out.str());
    ASSERT_EQ(rs.size(), 2u);
    EXPECT_EQ(getInt(findPath(rs[0], {"error", "code"})).value_or(0), -32700);
    EXPECT_TRUE(rs[0].find("id")->isNull());
    EXPECT_EQ(getInt(rs[1].find("id")).value_or(0), 2);
}

TEST(StdioServer, PooledModeAnswersEveryRequestOnItsOwnLine) {
    StdioServerOptions opts;
    opts.workers = 4;
    std::string input;
    // The first request is slow so later ones may overtake it
    input += R"({"jsonrpc":"2.0","id":0,"method":"tools/call","params":{"name":"slow","arguments":{"ms":50}}})";
    input += "\n";
    for (int i = 1; i < 20; ++i) {
        input += echoCall(i, "m" + std::to_string(i)) + "\n";
    }
    std::istringstream in(input);
    std::ostringstream out;
    StdioServer server(makeDispatcher(), opts);
    EXPECT_EQ(server.Run(in, out), 20u);

    auto rs = responses(out.str());
    ASSERT_EQ(rs.size(), 20u);
    std::set<int64_t> ids;
    for (const auto& r : rs) {
        ASSERT_NE(r.find("result"), nullptr);
        ids.insert(getInt(r.find("id")).value_or(-1));
    }
    EXPECT_EQ(ids.size(), 20u);
    EXPECT_EQ(*ids.begin(), 0);
    EXPECT_EQ(*ids.rbegin(), 19);
}

TEST(StdioServer, EmptyInputReturnsImmediately) {
    std::istringstream in("");
    std::ostringstream out;
    StdioServer server(makeDispatcher());
    EXPECT_EQ(server.Run(in, out), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(StdioServer, RequiresDispatcher) {
    EXPECT_THROW(StdioServer(nullptr), std::invalid_argument);
}
