//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: GoogleTests for tool/resource registration, lookup order and freezing
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>

#include "f1mcp/Registry.h"

using namespace f1mcp;

namespace {
JSONValue echo(const JSONValue& args) { return args; }
}

TEST(Registry, ListsToolsInRegistrationOrder) {
    ToolRegistry reg;
    reg.Register(Tool("zeta", "last letter"), echo);
    reg.Register(Tool("alpha", "first letter"), echo);
    reg.Register(Tool("mid", "middle"), echo);

    auto tools = reg.List();
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(tools[0].name, "zeta");
    EXPECT_EQ(tools[1].name, "alpha");
    EXPECT_EQ(tools[2].name, "mid");
}

TEST(Registry, ResolveReturnsHandler) {
    ToolRegistry reg;
    reg.Register(Tool("echo", "echo"), echo);
    const ToolEntry* entry = reg.Resolve("echo");
    ASSERT_NE(entry, nullptr);
    JSONValue out = entry->handler(JSONValue("hi"));
    EXPECT_EQ(getString(&out).value(), "hi");
    EXPECT_EQ(reg.Resolve("missing"), nullptr);
}

TEST(Registry, RejectsDuplicatesAndEmptyNames) {
    ToolRegistry reg;
    reg.Register(Tool("echo", "echo"), echo);
    EXPECT_THROW(reg.Register(Tool("echo", "again"), echo), std::invalid_argument);
    EXPECT_THROW(reg.Register(Tool("", "nameless"), echo), std::invalid_argument);
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(Registry, FrozenRegistryRejectsRegistration) {
    Registries regs;
    regs.tools.Register(Tool("echo", "echo"), echo);
    regs.resources.Register(Resource("f1://a", "A"), [](const std::string& uri) { return JSONValue(uri); });
    regs.Freeze();
    EXPECT_TRUE(regs.tools.IsFrozen());
    EXPECT_TRUE(regs.resources.IsFrozen());
    EXPECT_THROW(regs.tools.Register(Tool("late", "late"), echo), std::logic_error);
    EXPECT_THROW(regs.resources.Register(Resource("f1://b", "B"),
                                         [](const std::string&) { return JSONValue(); }), std::logic_error);
    EXPECT_NE(regs.resources.Resolve("f1://a"), nullptr);
}
