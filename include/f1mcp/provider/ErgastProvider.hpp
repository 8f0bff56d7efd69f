//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErgastProvider.hpp
// Purpose: Ergast-compatible F1 REST API provider (Jolpica mirror by default)
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "f1mcp/net/HttpClient.hpp"
#include "f1mcp/provider/DataProvider.h"

namespace f1mcp {
namespace provider {

constexpr const char* kDefaultErgastBaseUrl = "https://api.jolpi.ca/ergast/f1";

//==========================================================================================================
// ErgastProvider
// Purpose: Maps ProviderQuery to GET {baseUrl}/{path}.json?{params} and classifies the outcome:
//            200 + JSON with MRData  -> success (value is the MRData object)
//            200 + unparseable body  -> Malformed
//            200 without MRData      -> SchemaMismatch
//            429 -> RateLimited, 5xx -> ServerError, other non-2xx -> ClientError
//          Transport failures keep the Network/AttemptTimeout classification of the HTTP client.
//==========================================================================================================
class ErgastProvider : public IDataProvider {
public:
    ErgastProvider(std::string baseUrl, std::shared_ptr<net::IHttpClient> http,
                   std::chrono::milliseconds attemptTimeout);

    FetchResult Fetch(const ProviderQuery& query, const net::BackoffClient::Attempt& attempt) override;
    std::string Name() const override { return "ergast"; }

    std::string UrlFor(const ProviderQuery& query) const;

private:
    std::string baseUrl;
    std::shared_ptr<net::IHttpClient> http;
    std::chrono::milliseconds attemptTimeout;
};

} // namespace provider
} // namespace f1mcp
