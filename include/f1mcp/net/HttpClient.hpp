//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.hpp
// Purpose: Blocking HTTP(S) GET client interface and Boost.Beast implementation
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "f1mcp/errors/FetchError.h"

namespace f1mcp {
namespace net {

struct HttpResponse {
    int status{0};
    std::string body;
    std::string contentType;
};

// Transport-level outcome: a response (any status) or a classified Network/AttemptTimeout failure.
struct HttpResult {
    std::optional<HttpResponse> response;
    std::optional<FetchError> error;
};

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Splits scheme://host[:port]/path?query. Missing scheme means http; missing path means "/".
UrlParts parseUrl(const std::string& url);

//==========================================================================================================
// IHttpClient
// Purpose: Abstract GET used by data providers; implementations must be callable from several threads.
//==========================================================================================================
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    // budget bounds the whole exchange (resolve, connect, TLS handshake, request, response).
    virtual HttpResult Get(const std::string& url, std::chrono::milliseconds budget) = 0;
};

struct HttpClientOptions {
    std::chrono::milliseconds connectTimeout{5000};
    std::chrono::milliseconds readTimeout{10000};
    std::string userAgent;
    bool verifyPeer{true};
    int maxRedirects{3};
    std::size_t bodyLimit{32 * 1024 * 1024};
};

//==========================================================================================================
// BeastHttpClient
// Purpose: IHttpClient over Boost.Beast with C++20 coroutines. Each Get runs on its own io_context, so calls
//          from different threads do not interfere. HTTPS uses OpenSSL with SNI and peer verification.
//==========================================================================================================
class BeastHttpClient : public IHttpClient {
public:
    explicit BeastHttpClient(HttpClientOptions options);
    ~BeastHttpClient() override;

    HttpResult Get(const std::string& url, std::chrono::milliseconds budget) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HttpClientFactory
// Purpose: Creates the production HTTP client.
//==========================================================================================================
class HttpClientFactory {
public:
    std::shared_ptr<IHttpClient> CreateClient(const HttpClientOptions& options);
};

} // namespace net
} // namespace f1mcp
