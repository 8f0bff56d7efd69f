//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.cpp
// Purpose: Newline-delimited JSON-RPC serving loop over a pair of streams (stdin/stdout in production)
//==========================================================================================================

#include "f1mcp/StdioServer.hpp"

#include <condition_variable>
#include <exception>
#include <istream>
#include <mutex>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "f1mcp/errors/Errors.h"
#include "logging/Logger.h"

namespace f1mcp {

class StdioServer::Impl {
public:
    std::shared_ptr<Dispatcher> dispatcher;
    StdioServerOptions options;

    std::mutex writeMutex;

    // Bounds the number of queued + running requests in pooled mode
    std::mutex slotMutex;
    std::condition_variable slotCv;
    int busy{0};

    Impl(std::shared_ptr<Dispatcher> d, StdioServerOptions o)
        : dispatcher(std::move(d)), options(o) {}

    void writeLine(std::ostream& out, const std::string& line) {
        std::lock_guard<std::mutex> lk(writeMutex);
        out << line << '\n';
        out.flush();
    }

    void handleLine(const std::string& line, std::ostream& out) {
        std::optional<std::string> response;
        try {
            response = dispatcher->Handle(line);
        } catch (const std::exception& e) {
            // Dispatcher answers every failure itself; reaching here means serialization failed
            LOG_ERROR("Unhandled error while serving a request: {}", e.what());
            response = errors::makeErrorResponse(nullptr, errors::fromException(e))->Serialize();
        } catch (...) {
            LOG_ERROR("Unhandled non-standard exception while serving a request");
            response = errors::makeErrorResponse(nullptr,
                errors::makeError(JSONRPCErrorCodes::InternalError, "Internal error"))->Serialize();
        }
        if (response.has_value()) {
            writeLine(out, *response);
        }
    }

    void acquireSlot(int limit) {
        std::unique_lock<std::mutex> lk(slotMutex);
        slotCv.wait(lk, [this, limit]() { return busy < limit; });
        ++busy;
    }

    void releaseSlot() {
        {
            std::lock_guard<std::mutex> lk(slotMutex);
            --busy;
        }
        slotCv.notify_one();
    }
};

StdioServer::StdioServer(std::shared_ptr<Dispatcher> dispatcher, StdioServerOptions options) {
    if (!dispatcher) {
        throw std::invalid_argument("StdioServer requires a dispatcher");
    }
    if (options.maxLineBytes == 0) {
        options.maxLineBytes = 1;
    }
    pImpl = std::make_unique<Impl>(std::move(dispatcher), options);
}

StdioServer::~StdioServer() = default;

std::size_t StdioServer::Run(std::istream& in, std::ostream& out) {
    const int workers = pImpl->options.workers;
    const bool pooled = workers > 1;
    std::unique_ptr<boost::asio::thread_pool> pool;
    if (pooled) {
        pool = std::make_unique<boost::asio::thread_pool>(static_cast<std::size_t>(workers));
    }
    LOG_INFO("Serving JSON-RPC over stdio ({})",
             pooled ? "pooled, " + std::to_string(workers) + " workers" : std::string("sequential"));

    std::size_t handled = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        ++handled;
        if (line.size() > pImpl->options.maxLineBytes) {
            LOG_WARN("Rejecting {}-byte line (limit {})", line.size(), pImpl->options.maxLineBytes);
            pImpl->writeLine(out, errors::makeErrorResponse(nullptr,
                errors::parseError("Message exceeds " + std::to_string(pImpl->options.maxLineBytes) + " bytes"))
                ->Serialize());
            continue;
        }
        if (!pooled) {
            pImpl->handleLine(line, out);
            continue;
        }
        // Twice the worker count may be queued before reading pauses
        pImpl->acquireSlot(workers * 2);
        Impl* impl = pImpl.get();
        boost::asio::post(*pool, [impl, msg = std::move(line), &out]() {
            impl->handleLine(msg, out);
            impl->releaseSlot();
        });
        line.clear();
    }

    if (pool) {
        pool->join();
    }
    LOG_INFO("Input closed after {} messages", handled);
    return handled;
}

} // namespace f1mcp
