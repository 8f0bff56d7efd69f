//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FakeDataProvider.h
// Purpose: Scripted IDataProvider shared by the data service, tools and stdio server tests
//==========================================================================================================

#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "f1mcp/provider/DataProvider.h"

namespace f1mcp {
namespace fakes {

//==========================================================================================================
// FakeDataProvider
// Purpose: Serves MRData bodies keyed by ProviderQuery::Target(). Unknown targets fail with ClientError 404
//          unless a failure kind was scripted for them. Records every target requested.
//==========================================================================================================
class FakeDataProvider : public provider::IDataProvider {
public:
    // body is the JSON text of the MRData object
    void Serve(const std::string& target, const std::string& body) {
        std::lock_guard<std::mutex> lock(mutex);
        bodies[target] = body;
    }

    void Fail(const std::string& target, FetchErrorKind kind, int status) {
        std::lock_guard<std::mutex> lock(mutex);
        failures[target] = std::make_pair(kind, status);
    }

    FetchResult Fetch(const provider::ProviderQuery& query, const net::BackoffClient::Attempt&) override {
        const std::string target = query.Target();
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(target);
        auto f = failures.find(target);
        if (f != failures.end()) {
            return FetchResult::failure(f->second.first, "scripted failure", f->second.second);
        }
        auto it = bodies.find(target);
        if (it == bodies.end()) {
            return FetchResult::failure(FetchErrorKind::ClientError, "no fixture for " + target, 404);
        }
        return FetchResult::success(parseJSON(it->second));
    }

    std::string Name() const override { return "fake"; }

    std::vector<std::string> Requests() const {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

    std::size_t RequestCount(const std::string& target) const {
        std::lock_guard<std::mutex> lock(mutex);
        std::size_t n = 0;
        for (const auto& r : requests) {
            if (r == target) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mutex;
    std::map<std::string, std::string> bodies;
    std::map<std::string, std::pair<FetchErrorKind, int>> failures;
    std::vector<std::string> requests;
};

// Target of page `offset` for a path, as F1DataService requests it.
inline std::string pageTarget(const std::string& path, int offset = 0) {
    return path + "?limit=100&offset=" + std::to_string(offset);
}

} // namespace fakes
} // namespace f1mcp
