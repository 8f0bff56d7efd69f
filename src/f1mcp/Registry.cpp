//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: Tool and resource registry implementation
//==========================================================================================================

#include "f1mcp/Registry.h"

#include <stdexcept>

#include "logging/Logger.h"

namespace f1mcp {

void ToolRegistry::Register(const Tool& tool, ToolHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Tool handler must be callable: " + tool.name);
    }
    impl.Add(tool.name, ToolEntry{tool, std::move(handler)}, "tool");
    LOG_DEBUG("Registered tool: {}", tool.name);
}

const ToolEntry* ToolRegistry::Resolve(const std::string& name) const {
    return impl.Find(name);
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> out;
    out.reserve(impl.Size());
    for (const auto& e : impl.All()) out.push_back(e.descriptor);
    return out;
}

void ResourceRegistry::Register(const Resource& resource, ResourceHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Resource handler must be callable: " + resource.uri);
    }
    impl.Add(resource.uri, ResourceEntry{resource, std::move(handler)}, "resource");
    LOG_DEBUG("Registered resource: {}", resource.uri);
}

const ResourceEntry* ResourceRegistry::Resolve(const std::string& uri) const {
    return impl.Find(uri);
}

std::vector<Resource> ResourceRegistry::List() const {
    std::vector<Resource> out;
    out.reserve(impl.Size());
    for (const auto& e : impl.All()) out.push_back(e.descriptor);
    return out;
}

} // namespace f1mcp
