//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpClient.cpp
// Purpose: Boost.Beast coroutine HTTP(S) GET with per-phase timeouts and redirect following
//==========================================================================================================

#include "f1mcp/net/HttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "logging/Logger.h"

namespace f1mcp {
namespace net {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;
using Clock = std::chrono::steady_clock;

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        std::transform(parts.scheme.begin(), parts.scheme.end(), parts.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(::tolower(c)); });
        pos = schemeEnd + 3;
    } else {
        parts.scheme = "http";
    }
    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.target = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.target = url.substr(slash);
        if (parts.target.front() == '?') parts.target.insert(parts.target.begin(), '/');
    }
    std::size_t colon = hostPort.find(':');
    if (colon == std::string::npos) {
        parts.host = hostPort;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = hostPort.substr(0, colon);
        parts.port = hostPort.substr(colon + 1);
    }
    return parts;
}

namespace {
struct RawResponse {
    HttpResponse response;
    std::string location;
};

bool isRedirect(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

UrlParts resolveLocation(const UrlParts& base, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return parseUrl(location);
    }
    UrlParts next = base;
    if (!location.empty() && location.front() == '/') {
        next.target = location;
    } else {
        auto lastSlash = base.target.rfind('/');
        next.target = base.target.substr(0, lastSlash + 1) + location;
    }
    return next;
}

HttpResult failure(FetchErrorKind kind, std::string message) {
    HttpResult r;
    FetchError e;
    e.kind = kind;
    e.message = std::move(message);
    r.error = std::move(e);
    return r;
}

// Maps an exception raised inside the exchange to a transport failure.
HttpResult classify(const std::exception_ptr& eptr, const UrlParts& u) {
    const std::string where = u.scheme + "://" + u.host + ":" + u.port;
    try {
        std::rethrow_exception(eptr);
    } catch (const boost::system::system_error& se) {
        if (se.code() == beast::error::timeout) {
            return failure(FetchErrorKind::AttemptTimeout, "Timed out talking to " + where);
        }
        if (se.code() == http::error::body_limit) {
            return failure(FetchErrorKind::Malformed, "Response body from " + where + " exceeds limit");
        }
        return failure(FetchErrorKind::Network, where + ": " + se.code().message());
    } catch (const std::exception& e) {
        return failure(FetchErrorKind::Internal, where + ": " + e.what());
    }
}
} // namespace

class BeastHttpClient::Impl {
public:
    HttpClientOptions opts;
    ssl::context sslCtx{ssl::context::tls_client};

    explicit Impl(HttpClientOptions o) : opts(std::move(o)) {
        ::SSL_CTX_set_min_proto_version(sslCtx.native_handle(), TLS1_2_VERSION);
        try {
            sslCtx.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            LOG_WARN("HTTP client: set_default_verify_paths failed: {}", e.what());
        }
        sslCtx.set_verify_mode(opts.verifyPeer ? ssl::verify_peer : ssl::verify_none);
    }

    static std::chrono::milliseconds phaseTimeout(std::chrono::milliseconds phase, Clock::time_point deadline) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return std::max(std::chrono::milliseconds(1), std::min(phase, remaining));
    }

    http::request<http::empty_body> makeRequest(const UrlParts& u) const {
        http::request<http::empty_body> req{http::verb::get, u.target, 11};
        req.set(http::field::host, u.host);
        req.set(http::field::accept, "application/json");
        req.set(http::field::connection, "close");
        if (!opts.userAgent.empty()) {
            req.set(http::field::user_agent, opts.userAgent);
        }
        return req;
    }

    template <typename Stream>
    asio::awaitable<RawResponse> exchange(Stream& stream, beast::tcp_stream& lowest, const UrlParts& u,
                                          Clock::time_point deadline) {
        auto req = makeRequest(u);
        lowest.expires_after(phaseTimeout(opts.readTimeout, deadline));
        co_await http::async_write(stream, req, asio::use_awaitable);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(opts.bodyLimit);
        co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
        auto res = parser.release();

        RawResponse raw;
        raw.response.status = static_cast<int>(res.result_int());
        raw.response.body = std::move(res.body());
        if (auto ct = res.find(http::field::content_type); ct != res.end()) {
            raw.response.contentType = std::string(ct->value());
        }
        if (auto loc = res.find(http::field::location); loc != res.end()) {
            raw.location = std::string(loc->value());
        }
        co_return raw;
    }

    asio::awaitable<RawResponse> coFetch(UrlParts u, Clock::time_point deadline) {
        auto executor = co_await asio::this_coro::executor;
        tcp::resolver resolver(executor);
        auto results = co_await resolver.async_resolve(u.host, u.port, asio::use_awaitable);
        LOG_DEBUG("HTTP resolved {}:{} target={}", u.host, u.port, u.target);

        if (u.scheme == "https") {
            beast::ssl_stream<beast::tcp_stream> stream(executor, sslCtx);
            if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
                throw boost::system::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
            }
            if (opts.verifyPeer) {
                (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
            }
            auto& lowest = beast::get_lowest_layer(stream);
            lowest.expires_after(phaseTimeout(opts.connectTimeout, deadline));
            co_await lowest.async_connect(results, asio::use_awaitable);
            lowest.expires_after(phaseTimeout(opts.connectTimeout, deadline));
            co_await stream.async_handshake(ssl::stream_base::client, asio::use_awaitable);
            RawResponse raw = co_await exchange(stream, lowest, u, deadline);
            beast::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
            co_return raw;
        }

        beast::tcp_stream stream(executor);
        stream.expires_after(phaseTimeout(opts.connectTimeout, deadline));
        co_await stream.async_connect(results, asio::use_awaitable);
        RawResponse raw = co_await exchange(stream, stream, u, deadline);
        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return raw;
    }
};

BeastHttpClient::BeastHttpClient(HttpClientOptions options)
    : pImpl(std::make_unique<Impl>(std::move(options))) {}

BeastHttpClient::~BeastHttpClient() = default;

HttpResult BeastHttpClient::Get(const std::string& url, std::chrono::milliseconds budget) {
    const auto deadline = Clock::now() + budget;
    UrlParts u = parseUrl(url);
    if (u.scheme != "http" && u.scheme != "https") {
        return failure(FetchErrorKind::ClientError, "Unsupported URL scheme: " + u.scheme);
    }

    for (int hop = 0; hop <= pImpl->opts.maxRedirects; ++hop) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            return failure(FetchErrorKind::AttemptTimeout, "No time left for GET " + u.host + u.target);
        }

        asio::io_context ioc;
        bool completed = false;
        std::exception_ptr error;
        RawResponse raw;
        asio::co_spawn(ioc, pImpl->coFetch(u, deadline),
            [&completed, &error, &raw](std::exception_ptr eptr, RawResponse r) {
                completed = true;
                error = eptr;
                if (!eptr) raw = std::move(r);
            });
        ioc.run_for(remaining);

        if (!completed) {
            return failure(FetchErrorKind::AttemptTimeout,
                "GET " + u.host + u.target + " did not complete within " + std::to_string(budget.count()) + " ms");
        }
        if (error) {
            return classify(error, u);
        }
        if (isRedirect(raw.response.status) && !raw.location.empty()) {
            LOG_DEBUG("HTTP {} redirect to {}", raw.response.status, raw.location);
            u = resolveLocation(u, raw.location);
            continue;
        }
        LOG_DEBUG("HTTP GET {}{} -> {} ({} bytes)", u.host, u.target, raw.response.status, raw.response.body.size());
        HttpResult result;
        result.response = std::move(raw.response);
        return result;
    }
    return failure(FetchErrorKind::Network, "Too many redirects for " + url);
}

std::shared_ptr<IHttpClient> HttpClientFactory::CreateClient(const HttpClientOptions& options) {
    return std::make_shared<BeastHttpClient>(options);
}

} // namespace net
} // namespace f1mcp
