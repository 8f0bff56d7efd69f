//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErgastProvider.cpp
// Purpose: Ergast REST adapter: URL construction, status classification and payload decoding
//==========================================================================================================

#include "f1mcp/provider/ErgastProvider.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

#include "logging/Logger.h"

namespace f1mcp {
namespace provider {

std::string urlEncode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", static_cast<unsigned int>(c));
            out += buf;
        }
    }
    return out;
}

std::string ProviderQuery::Target() const {
    std::string t = path;
    char sep = '?';
    for (const auto& [k, v] : params) {
        t.push_back(sep);
        t += urlEncode(k) + "=" + urlEncode(v);
        sep = '&';
    }
    return t;
}

std::string ProviderQuery::CacheKey() const {
    return "ergast:" + Target();
}

ErgastProvider::ErgastProvider(std::string base, std::shared_ptr<net::IHttpClient> client,
                               std::chrono::milliseconds timeout)
    : baseUrl(std::move(base)), http(std::move(client)), attemptTimeout(timeout) {
    while (!baseUrl.empty() && baseUrl.back() == '/') baseUrl.pop_back();
    if (!http) {
        throw std::invalid_argument("ErgastProvider requires an HTTP client");
    }
}

std::string ErgastProvider::UrlFor(const ProviderQuery& query) const {
    std::string url = baseUrl + "/" + query.path + ".json";
    char sep = '?';
    for (const auto& [k, v] : query.params) {
        url.push_back(sep);
        url += urlEncode(k) + "=" + urlEncode(v);
        sep = '&';
    }
    return url;
}

FetchResult ErgastProvider::Fetch(const ProviderQuery& query, const net::BackoffClient::Attempt& attempt) {
    const std::string url = UrlFor(query);
    const auto budget = std::min(attemptTimeout, attempt.Remaining(net::BackoffClient::Clock::now()));
    if (budget.count() <= 0) {
        return FetchResult::failure(FetchErrorKind::Timeout, "No time left to fetch " + url);
    }
    LOG_DEBUG("Ergast GET {} (attempt {}, budget {} ms)", url, attempt.number, budget.count());

    net::HttpResult hr = http->Get(url, budget);
    if (hr.error.has_value()) {
        return FetchResult::failure(std::move(hr.error.value()));
    }
    if (!hr.response.has_value()) {
        return FetchResult::failure(FetchErrorKind::Internal, "HTTP client returned neither response nor error");
    }
    const auto& resp = hr.response.value();

    if (resp.status == 429) {
        return FetchResult::failure(FetchErrorKind::RateLimited, "Rate limited by provider", resp.status);
    }
    if (resp.status >= 500) {
        return FetchResult::failure(FetchErrorKind::ServerError, "Provider server error", resp.status);
    }
    if (resp.status < 200 || resp.status >= 300) {
        std::string snippet = resp.body.substr(0, 200);
        return FetchResult::failure(FetchErrorKind::ClientError,
            "Provider rejected request " + query.Target() + (snippet.empty() ? "" : ": " + snippet), resp.status);
    }

    JSONValue doc;
    try {
        doc = parseJSON(resp.body);
    } catch (const JsonParseError& e) {
        return FetchResult::failure(FetchErrorKind::Malformed,
            std::string("Provider returned invalid JSON: ") + e.what(), resp.status);
    }
    const JSONValue* mr = doc.find("MRData");
    if (mr == nullptr || !mr->isObject()) {
        return FetchResult::failure(FetchErrorKind::SchemaMismatch, "Provider response lacks MRData", resp.status);
    }
    return FetchResult::success(*mr);
}

} // namespace provider
} // namespace f1mcp
