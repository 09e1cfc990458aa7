//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/HTTPServer.cpp
// Purpose: HTTP/HTTPS server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <thread>
#include <unordered_map>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "logging/Logger.h"
#include "oauthweb/HTTPServer.hpp"
#include "oauthweb/UrlEncoded.hpp"

namespace oauthweb {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;

    std::unordered_map<std::string, HTTPServer::Handler> routes;
    ErrorStatusPolicy errorPolicy;
    HTTPServer::ErrorHandler errorHandler;

    // Declared last: destroyed first, joining in-flight handlers while routes are still alive.
    net::thread_pool handlerPool;

    explicit Impl(const HTTPServer::Options& o)
        : opts(o), handlerPool(std::max<std::size_t>(o.handlerThreads, 1)) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        if (errorHandler) { errorHandler(msg); }
    }

    void reportSessionError(const char* what, const std::exception& e) {
        if (!running.load()) {
#ifdef _DEBUG
            LOG_DEBUG("HTTPServer {} suppressed during shutdown: {}", what, e.what());
#endif
            return;
        }
        setError(std::string("HTTPServer ") + what + " error: " + e.what());
    }

    // Reads one request (the only suspension point before the handler runs), answers it, then closes.
    // Handlers run on handlerPool; the session resumes on its own executor.
    template <typename Stream>
    net::awaitable<void> serveOne(Stream& stream) {
        boost::beast::flat_buffer buffer;
        HttpRequest req;
        co_await http::async_read(stream, buffer, req, net::use_awaitable);
        HttpResponse res = co_await net::co_spawn(
            handlerPool,
            [this, &req]() -> net::awaitable<HttpResponse> { co_return handle(req); },
            net::use_awaitable);
        res.keep_alive(false);
        co_await http::async_write(stream, res, net::use_awaitable);
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serveOne(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            reportSessionError("plain session", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serveOne(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            reportSessionError("TLS session", e);
        }
        co_return;
    }

    HttpResponse handle(const HttpRequest& req) {
        const std::string target(req.target());
        const std::string path = target.substr(0, target.find('?'));
        auto it = routes.find(path);
        if (it == routes.end()) {
            HttpResponse res{http::status::not_found, req.version()};
            res.set(http::field::content_type, "text/plain");
            res.body() = "Not Found";
            res.prepare_payload();
            return res;
        }
        try {
            return it->second(req);
        } catch (const WebError& e) {
            return renderError(e, errorPolicy, req.version());
        } catch (const std::exception& e) {
            LOG_ERROR("Handler for {} failed: {}", path, e.what());
            HttpResponse res{http::status::internal_server_error, req.version()};
            res.set(http::field::content_type, "text/plain");
            res.body() = "Internal Server Error";
            res.prepare_payload();
            return res;
        }
    }

    net::awaitable<void> acceptLoop() {
        try {
            // Validate port strictly: numeric and within [0, 65535]
            if (opts.port.empty()) {
                setError("HTTPServer invalid port: empty");
                co_return;
            }
            bool allDigits = std::all_of(opts.port.begin(), opts.port.end(), [](unsigned char ch){ return std::isdigit(ch) != 0; });
            if (!allDigits || opts.port.size() > 5 || std::stoul(opts.port) > 65535ul) {
                setError(std::string("HTTPServer invalid port: ") + opts.port);
                co_return;
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            LOG_INFO("HTTPServer listening on {}://{}:{}", opts.scheme, opts.address, opts.port);

            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            reportSessionError("accept", e);
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        bool signaled = false;
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            signaled = true;
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(e.what());
            // Failures are reported through the error handler; Start() callers must not see a broken promise
            if (!signaled) { pr.set_value(); }
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    LOG_INFO("HTTPServer stopped");
    done.set_value();
    return fut;
}

void HTTPServer::Route(const std::string& path, Handler handler) {
    pImpl->routes[path] = std::move(handler);
}

void HTTPServer::SetErrorPolicy(const ErrorStatusPolicy& policy) {
    pImpl->errorPolicy = policy;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

HttpResponse HTTPServer::Handle(const HttpRequest& req) {
    return pImpl->handle(req);
}

HTTPServer::Options HTTPServerFactory::ParseOptions(const std::string& config) {
    HTTPServer::Options opts;
    // Factory default: http if scheme omitted
    opts.scheme = "http";

    std::string cfg = config;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath.substr(0, hostPortPath.find('/'));
    trim(hostPort);

    // host[:port], including [v6addr]:port
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "9443";
    }

    if (!query.empty()) {
        ParseResult params = parseUrlEncoded(query);
        if (params.status == ParseStatus::Ok) {
            if (auto cert = params.params->UniqueValue("cert")) opts.certFile = *cert;
            if (auto key = params.params->UniqueValue("key")) opts.keyFile = *key;
        } else {
            LOG_WARN("HTTPServerFactory: ignoring malformed parameters in '{}'", config);
        }
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::Create(const std::string& config) {
    return std::make_unique<HTTPServer>(ParseOptions(config));
}

} // namespace oauthweb
