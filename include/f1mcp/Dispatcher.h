//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: JSON-RPC 2.0 envelope validation and method routing for the MCP surface
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "f1mcp/JSONRPCTypes.h"
#include "f1mcp/Protocol.h"
#include "f1mcp/Registry.h"

namespace f1mcp {

//==========================================================================================================
// Dispatcher
// Purpose: Turns one raw JSON-RPC line into at most one response line. Routes initialize, tools/list,
//          tools/call, resources/list and resources/read against an immutable Registries object.
//          Thread-safe: Handle() may be called concurrently once constructed.
// Ctors:
//   Dispatcher(registries, serverInfo): registries must already be frozen.
// Methods:
//   Handle(rawLine): Serialized response, or std::nullopt for notifications.
//   HandleRequest(request): Typed entry for an already-parsed non-notification request.
//   IsInitialized(): True once an initialize request has been answered.
//==========================================================================================================
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const Registries> registries, Implementation serverInfo);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    std::optional<std::string> Handle(const std::string& rawLine);
    std::unique_ptr<JSONRPCResponse> HandleRequest(const JSONRPCRequest& request);
    bool IsInitialized() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace f1mcp
