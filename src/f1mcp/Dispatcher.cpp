//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: JSON-RPC request parsing, routing and error translation
//==========================================================================================================

#include "f1mcp/Dispatcher.h"

#include <atomic>
#include <chrono>
#include <stdexcept>

#include "f1mcp/errors/Errors.h"
#include "f1mcp/validation/SchemaValidator.h"
#include "logging/Logger.h"

namespace f1mcp {

class Dispatcher::Impl {
public:
    std::shared_ptr<const Registries> registries;
    Implementation serverInfo;
    std::atomic<bool> initialized{false};

    Impl(std::shared_ptr<const Registries> regs, Implementation info)
        : registries(std::move(regs)), serverInfo(std::move(info)) {}

    static std::unique_ptr<JSONRPCResponse> makeResult(const JSONRPCId& id, JSONValue result) {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = id;
        resp->result = std::move(result);
        return resp;
    }

    static const JSONValue* param(const JSONRPCRequest& req, const char* key) {
        if (!req.params.has_value()) return nullptr;
        return req.params->find(key);
    }

    // Answer for failures that carry no std::exception to translate
    static errors::McpError internalError() {
        return errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error");
    }

    ////////////////////////////////////////// initialize //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& req) {
        const JSONValue* clientInfo = param(req, "clientInfo");
        const std::string clientName = getString(clientInfo ? clientInfo->find("name") : nullptr).value_or("unknown");
        const std::string clientProto = getString(param(req, "protocolVersion")).value_or("unspecified");
        LOG_INFO("Handling initialize request (client={}, protocolVersion={})", clientName, clientProto);

        ServerCapabilities caps;
        caps.tools = ToolsCapability{};
        caps.resources = ResourcesCapability{};

        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = makeJSON(PROTOCOL_VERSION);
        resultObj["capabilities"] = makeJSON(toJSON(caps));
        resultObj["serverInfo"] = makeJSON(toJSON(serverInfo));
        initialized.store(true);
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    ////////////////////////////////////////// tools //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        JSONValue::Array arr;
        for (const auto& tool : registries->tools.List()) {
            arr.push_back(makeJSON(toJSON(tool)));
        }
        JSONValue::Object resultObj;
        resultObj["tools"] = makeJSON(std::move(arr));
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        const JSONValue* nameVal = param(req, "name");
        auto name = getString(nameVal);
        if (!name.has_value() || name->empty()) {
            return errors::makeErrorResponse(req.id, errors::invalidParams("Invalid params: 'name' must be a non-empty string", "name"));
        }
        LOG_DEBUG("Handling tools/call request: {}", *name);

        const ToolEntry* entry = registries->tools.Resolve(*name);
        if (entry == nullptr) {
            LOG_WARN("tools/call for unknown tool: {}", *name);
            return errors::makeErrorResponse(req.id, errors::methodNotFound("tool", *name));
        }

        // Absent or null arguments mean "no arguments"
        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = param(req, "arguments"); a != nullptr && !a->isNull()) {
            arguments = *a;
        }
        if (auto violation = validation::validateArguments(entry->descriptor.inputSchema, arguments)) {
            LOG_DEBUG("tools/call {} rejected: {}", *name, violation->what());
            return errors::makeErrorResponse(req.id, errors::fromValidation(*violation));
        }

        const auto started = std::chrono::steady_clock::now();
        JSONValue value;
        try {
            value = entry->handler(arguments);
        } catch (const std::exception& e) {
            LOG_WARN("Tool '{}' failed: {}", *name, e.what());
            return errors::makeErrorResponse(req.id, errors::fromException(e));
        } catch (...) {
            LOG_ERROR("Tool '{}' threw a non-standard exception", *name);
            return errors::makeErrorResponse(req.id, internalError());
        }
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        LOG_INFO("Tool '{}' completed in {} ms", *name, elapsedMs);

        JSONValue::Object textItem;
        textItem["type"] = makeJSON("text");
        if (auto s = getString(&value)) {
            textItem["text"] = makeJSON(*s);
        } else {
            textItem["text"] = makeJSON(serializeJSONValuePretty(value));
        }
        JSONValue::Array content;
        content.push_back(makeJSON(std::move(textItem)));
        JSONValue::Object resultObj;
        resultObj["content"] = makeJSON(std::move(content));
        resultObj["isError"] = makeJSON(false);
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    ////////////////////////////////////////// resources //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> handleResourcesList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling resources/list request");
        JSONValue::Array arr;
        for (const auto& r : registries->resources.List()) {
            arr.push_back(makeJSON(toJSON(r)));
        }
        JSONValue::Object resultObj;
        resultObj["resources"] = makeJSON(std::move(arr));
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    std::unique_ptr<JSONRPCResponse> handleResourcesRead(const JSONRPCRequest& req) {
        auto uri = getString(param(req, "uri"));
        if (!uri.has_value() || uri->empty()) {
            return errors::makeErrorResponse(req.id, errors::invalidParams("Invalid params: 'uri' must be a non-empty string", "uri"));
        }
        LOG_DEBUG("Handling resources/read request: {}", *uri);

        const ResourceEntry* entry = registries->resources.Resolve(*uri);
        if (entry == nullptr) {
            LOG_WARN("resources/read for unknown resource: {}", *uri);
            return errors::makeErrorResponse(req.id, errors::methodNotFound("resource", *uri));
        }

        JSONValue value;
        try {
            value = entry->handler(*uri);
        } catch (const std::exception& e) {
            LOG_WARN("Resource '{}' failed: {}", *uri, e.what());
            return errors::makeErrorResponse(req.id, errors::fromException(e));
        } catch (...) {
            LOG_ERROR("Resource '{}' threw a non-standard exception", *uri);
            return errors::makeErrorResponse(req.id, internalError());
        }

        JSONValue::Object item;
        item["uri"] = makeJSON(*uri);
        item["mimeType"] = makeJSON(entry->descriptor.mimeType.value_or("application/json"));
        if (auto s = getString(&value)) {
            item["text"] = makeJSON(*s);
        } else {
            item["text"] = makeJSON(serializeJSONValuePretty(value));
        }
        JSONValue::Array contents;
        contents.push_back(makeJSON(std::move(item)));
        JSONValue::Object resultObj;
        resultObj["contents"] = makeJSON(std::move(contents));
        return makeResult(req.id, JSONValue{std::move(resultObj)});
    }

    ////////////////////////////////////////// routing //////////////////////////////////////////
    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req) {
        try {
            if (req.method == Methods::Initialize) {
                return handleInitialize(req);
            } else if (req.method == Methods::ListTools) {
                return handleToolsList(req);
            } else if (req.method == Methods::CallTool) {
                return handleToolsCall(req);
            } else if (req.method == Methods::ListResources) {
                return handleResourcesList(req);
            } else if (req.method == Methods::ReadResource) {
                return handleResourcesRead(req);
            }
            LOG_WARN("Unknown method: {}", req.method);
            return errors::makeErrorResponse(req.id, errors::methodNotFound("method", req.method));
        } catch (const std::exception& e) {
            LOG_ERROR("Request {} ({}) failed: {}", idToString(req.id), req.method, e.what());
            return errors::makeErrorResponse(req.id, errors::fromException(e));
        } catch (...) {
            LOG_ERROR("Request {} ({}) failed with a non-standard exception", idToString(req.id), req.method);
            return errors::makeErrorResponse(req.id, internalError());
        }
    }

    void handleNotification(const JSONRPCRequest& note) {
        if (note.method == Methods::Initialized) {
            LOG_INFO("Client reported initialized");
        } else if (note.method == Methods::Cancelled) {
            LOG_DEBUG("Ignoring cancellation notification; requests are not cancellable");
        } else {
            LOG_DEBUG("Ignoring notification: {}", note.method);
        }
    }
};

Dispatcher::Dispatcher(std::shared_ptr<const Registries> registries, Implementation serverInfo) {
    if (!registries) {
        throw std::invalid_argument("Dispatcher requires registries");
    }
    if (!registries->tools.IsFrozen() || !registries->resources.IsFrozen()) {
        throw std::logic_error("Dispatcher requires frozen registries");
    }
    pImpl = std::make_unique<Impl>(std::move(registries), std::move(serverInfo));
}

Dispatcher::~Dispatcher() = default;

bool Dispatcher::IsInitialized() const {
    return pImpl->initialized.load();
}

std::unique_ptr<JSONRPCResponse> Dispatcher::HandleRequest(const JSONRPCRequest& request) {
    return pImpl->dispatchRequest(request);
}

std::optional<std::string> Dispatcher::Handle(const std::string& rawLine) {
    JSONValue envelope;
    try {
        envelope = parseJSON(rawLine);
    } catch (const JsonParseError& e) {
        LOG_WARN("Parse error: {}", e.what());
        return errors::makeErrorResponse(nullptr, errors::parseError(e.what()))->Serialize();
    }
    if (!envelope.isObject()) {
        LOG_WARN("Rejected non-object JSON-RPC message ({})", envelope.isArray() ? "batch" : "scalar");
        return errors::makeErrorResponse(nullptr,
            errors::parseError("JSON-RPC message must be an object"))->Serialize();
    }

    JSONRPCRequest req;
    bool idValid = true;
    if (const JSONValue* idVal = envelope.find("id")) {
        if (auto s = std::get_if<std::string>(&idVal->value)) {
            req.id = *s;
        } else if (auto n = getInt(idVal)) {
            // Integral doubles such as 1.0 are echoed back as integers
            req.id = *n;
        } else if (!idVal->isNull()) {
            idValid = false;
        }
    }

    const JSONValue* methodVal = envelope.find("method");
    auto method = getString(methodVal);
    const JSONValue* paramsVal = envelope.find("params");

    if (!idValid) {
        LOG_WARN("Rejected request with unsupported id type");
        return errors::makeErrorResponse(nullptr,
            errors::invalidParams("Invalid request: id must be a string, integer or null", "id"))->Serialize();
    }
    if (!method.has_value() || method->empty()) {
        if (req.IsNotification()) {
            LOG_WARN("Dropping notification without a method");
            return std::nullopt;
        }
        return errors::makeErrorResponse(req.id,
            errors::invalidParams("Invalid request: 'method' must be a non-empty string", "method"))->Serialize();
    }
    req.method = *method;
    if (paramsVal != nullptr && !paramsVal->isNull()) {
        if (!paramsVal->isObject()) {
            if (req.IsNotification()) {
                LOG_WARN("Dropping notification {} with non-object params", req.method);
                return std::nullopt;
            }
            return errors::makeErrorResponse(req.id,
                errors::invalidParams("Invalid params: 'params' must be an object", "params"))->Serialize();
        }
        req.params = *paramsVal;
    }

    if (req.IsNotification()) {
        pImpl->handleNotification(req);
        return std::nullopt;
    }
    return pImpl->dispatchRequest(req)->Serialize();
}

} // namespace f1mcp
