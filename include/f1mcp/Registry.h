//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Tool and resource registries mapping names/URIs to descriptors and handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "f1mcp/Protocol.h"

namespace f1mcp {

// Tool handler: receives schema-validated arguments, returns a structured value or throws errors::DataError.
using ToolHandler = std::function<JSONValue(const JSONValue& arguments)>;

// Resource handler: receives the requested URI, returns a structured value or throws errors::DataError.
using ResourceHandler = std::function<JSONValue(const std::string& uri)>;

struct ToolEntry {
    Tool descriptor;
    ToolHandler handler;
};

struct ResourceEntry {
    Resource descriptor;
    ResourceHandler handler;
};

namespace detail {
//==========================================================================================================
// OrderedRegistry
// Purpose: Insertion-ordered map from key to entry, writable until Freeze(). Reads take no lock; callers
//          populate it on one thread before serving and share it read-only afterwards.
//==========================================================================================================
template <typename Entry>
class OrderedRegistry {
public:
    // Throws std::logic_error after Freeze(), std::invalid_argument on an empty or duplicate key.
    void Add(const std::string& key, Entry entry, const char* kind) {
        if (frozen) {
            throw std::logic_error(std::string(kind) + " registry is frozen; cannot register '" + key + "'");
        }
        if (key.empty()) {
            throw std::invalid_argument(std::string(kind) + " key must not be empty");
        }
        if (index.count(key) != 0) {
            throw std::invalid_argument(std::string("Duplicate ") + kind + ": " + key);
        }
        index.emplace(key, entries.size());
        entries.push_back(std::move(entry));
    }

    const Entry* Find(const std::string& key) const {
        auto it = index.find(key);
        if (it == index.end()) return nullptr;
        return &entries[it->second];
    }

    const std::vector<Entry>& All() const { return entries; }
    void Freeze() { frozen = true; }
    bool IsFrozen() const { return frozen; }
    std::size_t Size() const { return entries.size(); }

private:
    std::vector<Entry> entries;
    std::unordered_map<std::string, std::size_t> index;
    bool frozen{false};
};
} // namespace detail

//==========================================================================================================
// ToolRegistry
// Purpose: Static mapping from tool name to descriptor + handler.
// Methods:
//   Register(tool, handler): Adds a tool; rejected after Freeze() or for duplicate names.
//   Resolve(name): Handler entry or nullptr.
//   List(): Descriptors in registration order.
//==========================================================================================================
class ToolRegistry {
public:
    void Register(const Tool& tool, ToolHandler handler);
    const ToolEntry* Resolve(const std::string& name) const;
    std::vector<Tool> List() const;
    std::size_t Size() const { return impl.Size(); }
    void Freeze() { impl.Freeze(); }
    bool IsFrozen() const { return impl.IsFrozen(); }

private:
    detail::OrderedRegistry<ToolEntry> impl;
};

//==========================================================================================================
// ResourceRegistry
// Purpose: Static mapping from resource URI to descriptor + handler.
//==========================================================================================================
class ResourceRegistry {
public:
    void Register(const Resource& resource, ResourceHandler handler);
    const ResourceEntry* Resolve(const std::string& uri) const;
    std::vector<Resource> List() const;
    std::size_t Size() const { return impl.Size(); }
    void Freeze() { impl.Freeze(); }
    bool IsFrozen() const { return impl.IsFrozen(); }

private:
    detail::OrderedRegistry<ResourceEntry> impl;
};

//==========================================================================================================
// Registries
// Purpose: Immutable configuration object handed to the Dispatcher. Build it, call Freeze(), then share it
//          as std::shared_ptr<const Registries>.
//==========================================================================================================
struct Registries {
    ToolRegistry tools;
    ResourceRegistry resources;

    void Freeze() {
        tools.Freeze();
        resources.Freeze();
    }
};

} // namespace f1mcp
