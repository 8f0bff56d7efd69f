//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioServer.hpp
// Purpose: Newline-delimited JSON-RPC serving loop over a pair of streams (stdin/stdout in production)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>

#include "f1mcp/Dispatcher.h"

namespace f1mcp {

struct StdioServerOptions {
    // 0 or 1: requests are handled one at a time in arrival order. N > 1: up to N requests run
    // concurrently and responses are written as they complete (correlate by id).
    int workers{0};
    // Lines longer than this are answered with a parse error without being parsed.
    std::size_t maxLineBytes{1024 * 1024};
};

//==========================================================================================================
// StdioServer
// Purpose: Reads one JSON-RPC message per line, hands it to the Dispatcher and writes each response as one
//          line. Blank lines are ignored and a trailing '\r' is stripped. Output lines are never interleaved.
// Methods:
//   Run(in, out): Serves until EOF on in; in pooled mode waits for outstanding requests before returning.
//                 Returns the number of lines handled.
//==========================================================================================================
class StdioServer {
public:
    StdioServer(std::shared_ptr<Dispatcher> dispatcher, StdioServerOptions options = StdioServerOptions{});
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    std::size_t Run(std::istream& in, std::ostream& out);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace f1mcp
