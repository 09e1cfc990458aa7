//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS server using Boost.Beast (TLS 1.3 only for HTTPS) hosting OAuth routes
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "env/EnvVars.h"
#include "oauthweb/HttpTypes.hpp"
#include "oauthweb/errors/ErrorResponse.hpp"

namespace oauthweb {

  class HTTPServer {
  public:
    // Route handler: framework request in, framework response out. May throw WebError. Handlers run on a
    // pool of handlerThreads threads, concurrently with each other.
    using Handler = std::function<HttpResponse(const HttpRequest&)>;
    using ErrorHandler = std::function<void(const std::string&)>;

    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port and TLS files.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 9443)
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   handlerThreads: Threads running route handlers (OAUTHWEB_HANDLER_THREADS, default 4, minimum 1)
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"9443"};
        std::string scheme{"https"};
        std::string certFile;
        std::string keyFile;
        std::size_t handlerThreads{GetEnvSizeOrDefault("OAUTHWEB_HANDLER_THREADS", 4)};
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Starts the server accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    //==========================================================================================================
    std::future<void> Stop();

    //==========================================================================================================
    // Route
    // Purpose: Register a handler for an exact path (query string ignored). Must be called before Start().
    //==========================================================================================================
    void Route(const std::string& path, Handler handler);

    // Status mapping for WebError thrown by handlers (default: all 500).
    void SetErrorPolicy(const ErrorStatusPolicy& policy);

    // Transport/session failures.
    void SetErrorHandler(ErrorHandler handler);

    //==========================================================================================================
    // Handle
    // Purpose: Produce the response for one request: route lookup, handler call, error rendering.
    //          Exposed so the dispatch path can be exercised without sockets.
    //==========================================================================================================
    HttpResponse Handle(const HttpRequest& req);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Builds an HTTPServer from a URI-style configuration string:
  //            - "http://<address>:<port>" (e.g., http://127.0.0.1:0)
  //            - "https://<address>:<port>?cert=<pem>&key=<pem>"
  //          Unknown parameters are ignored. If scheme is omitted, defaults to http.
  //==========================================================================================================
  class HTTPServerFactory {
  public:
    static HTTPServer::Options ParseOptions(const std::string& config);
    std::unique_ptr<HTTPServer> Create(const std::string& config);
  };

} // namespace oauthweb
