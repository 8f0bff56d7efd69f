//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol descriptors, capability constants and method names served by f1mcp
//==========================================================================================================

#pragma once

#include "f1mcp/JSONRPCTypes.h"
#include <string>
#include <optional>

namespace f1mcp {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revision reported by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Server identity reported in initialize.serverInfo
constexpr const char* SERVER_NAME = "f1-data-server";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool descriptor advertised by tools/list. Immutable once registered.
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema object: { type, properties, required }

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
// Resource descriptor advertised by resources/list. Immutable once registered.
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Serialization ///////////////////////////////////////////
JSONValue toJSON(const Tool& tool);
JSONValue toJSON(const Resource& resource);
JSONValue toJSON(const ServerCapabilities& caps);
JSONValue toJSON(const Implementation& impl);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace f1mcp
