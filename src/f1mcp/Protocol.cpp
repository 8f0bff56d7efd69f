//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON shapes for tool/resource descriptors and initialize metadata
//==========================================================================================================

#include "f1mcp/Protocol.h"

namespace f1mcp {

JSONValue toJSON(const Tool& tool) {
    JSONValue::Object to;
    to["name"] = makeJSON(tool.name);
    to["description"] = makeJSON(tool.description);
    // An empty schema still advertises an object input
    if (tool.inputSchema.isNull()) {
        JSONValue::Object schema;
        schema["type"] = makeJSON("object");
        schema["properties"] = makeJSON(JSONValue::Object{});
        to["inputSchema"] = makeJSON(std::move(schema));
    } else {
        to["inputSchema"] = makeJSON(tool.inputSchema);
    }
    return JSONValue{std::move(to)};
}

JSONValue toJSON(const Resource& resource) {
    JSONValue::Object ro;
    ro["uri"] = makeJSON(resource.uri);
    ro["name"] = makeJSON(resource.name);
    if (resource.description.has_value()) ro["description"] = makeJSON(resource.description.value());
    if (resource.mimeType.has_value()) ro["mimeType"] = makeJSON(resource.mimeType.value());
    return JSONValue{std::move(ro)};
}

JSONValue toJSON(const ServerCapabilities& caps) {
    JSONValue::Object capsObj;
    if (caps.tools.has_value()) {
        JSONValue::Object t;
        t["listChanged"] = makeJSON(caps.tools->listChanged);
        capsObj["tools"] = makeJSON(std::move(t));
    }
    if (caps.resources.has_value()) {
        JSONValue::Object r;
        r["subscribe"] = makeJSON(caps.resources->subscribe);
        r["listChanged"] = makeJSON(caps.resources->listChanged);
        capsObj["resources"] = makeJSON(std::move(r));
    }
    return JSONValue{std::move(capsObj)};
}

JSONValue toJSON(const Implementation& impl) {
    JSONValue::Object o;
    o["name"] = makeJSON(impl.name);
    o["version"] = makeJSON(impl.version);
    return JSONValue{std::move(o)};
}

} // namespace f1mcp
