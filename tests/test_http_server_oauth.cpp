//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_server_oauth.cpp
// Purpose: Loopback GoogleTests for OAuth routes hosted by HTTPServer and served through an EndpointWorker
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "oauthweb/EndpointWorker.hpp"
#include "oauthweb/HTTPServer.hpp"
#include "oauthweb/OAuthRequest.hpp"
#include "oauthweb/Operations.hpp"
#include "oauthweb/async/Reply.hpp"

using namespace std::chrono;
using namespace oauthweb;

namespace {

//==========================================================================================================
// ScriptedEndpoint
// Purpose: Minimal engine: echoes the code into the redirect, issues a fixed token, accepts one bearer.
//==========================================================================================================
class ScriptedEndpoint : public IEndpoint {
public:
    explicit ScriptedEndpoint(std::atomic<int>& calls) : calls(calls) {}

    void Authorize(IWebRequest& request, IWebResponse& response) override {
        calls.fetch_add(1);
        auto code = request.Query().UniqueValue("code");
        if (!code) {
            throw EndpointError(OAuthError::DenySilently);
        }
        response.Redirect("https://client.example/cb?code=" + *code);
    }

    void AccessToken(IWebRequest& request, IWebResponse& response) override {
        calls.fetch_add(1);
        if (request.UrlBody().UniqueValue("code") != std::optional<std::string>("abc")) {
            response.ClientError();
            response.BodyJson("{\"error\":\"invalid_grant\"}");
            return;
        }
        response.BodyJson("{\"access_token\":\"tok\",\"token_type\":\"bearer\"}");
    }

    void Refresh(IWebRequest&, IWebResponse& response) override {
        calls.fetch_add(1);
        response.BodyJson("{\"access_token\":\"tok2\"}");
    }

    std::optional<Grant> Resource(IWebRequest& request, IWebResponse& response) override {
        calls.fetch_add(1);
        if (request.AuthHeader() != std::optional<std::string>("Bearer tok")) {
            response.Unauthorized("Bearer");
            return std::nullopt;
        }
        Grant g;
        g.ownerId = "owner";
        return g;
    }

private:
    std::atomic<int>& calls;
};

//==========================================================================================================
// findFreePort
// Purpose: Obtain an available local TCP port by binding to port 0 temporarily.
//==========================================================================================================
static unsigned short findFreePort() {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::acceptor acc(ioc);
    tcp::endpoint ep(tcp::v4(), 0);
    acc.open(ep.protocol());
    acc.set_option(tcp::acceptor::reuse_address(true));
    acc.bind(ep);
    auto port = acc.local_endpoint().port();
    acc.close();
    return port;
}

//==========================================================================================================
// roundTrip
// Purpose: Send one request to the loopback server and read the response (synchronously). Connection is
//          retried briefly while the acceptor comes up.
//==========================================================================================================
static HttpResponse roundTrip(unsigned short port, HttpRequest req) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    for (int attempt = 0;; ++attempt) {
        boost::system::error_code ec;
        boost::asio::connect(socket, r, ec);
        if (!ec) break;
        if (attempt >= 50) throw boost::system::system_error(ec);
        socket = tcp::socket{ioc};
        std::this_thread::sleep_for(milliseconds(10));
    }

    req.set(http::field::host, "127.0.0.1");
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    HttpResponse res;
    http::read(socket, buffer, res);

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

//==========================================================================================================
// OAuthServerFixture
// Purpose: HTTPServer with /authorize, /token, /refresh and /resource routes backed by an EndpointWorker.
//==========================================================================================================
class OAuthServerFixture : public ::testing::Test {
protected:
    std::atomic<int> calls{0};
    std::unique_ptr<EndpointWorker> worker;
    std::unique_ptr<HTTPServer> server;
    unsigned short port{0};

    template <typename Op>
    static HttpResponse dispatch(EndpointWorker& w, Op op, unsigned int version) {
        auto reply = w.Send(wrap(std::move(op)));
        return async::waitReply(reply, seconds(5)).ToHttp(version);
    }

    void SetUp() override {
        worker = std::make_unique<EndpointWorker>(std::make_unique<ScriptedEndpoint>(calls));
        worker->Start();

        port = findFreePort();
        HTTPServer::Options opts; opts.scheme = "http"; opts.address = "127.0.0.1"; opts.port = std::to_string(port);
        server = std::make_unique<HTTPServer>(opts);

        EndpointWorker& w = *worker;
        server->Route("/authorize", [&w](const HttpRequest& req) {
            return dispatch(w, Authorize(OAuthRequest::FromHttp(req)), req.version());
        });
        server->Route("/token", [&w](const HttpRequest& req) {
            return dispatch(w, Token(OAuthRequest::FromHttp(req)), req.version());
        });
        server->Route("/refresh", [&w](const HttpRequest& req) {
            return dispatch(w, Refresh(OAuthRequest::FromHttp(req)), req.version());
        });
        server->Route("/resource", [&w](const HttpRequest& req) {
            auto reply = w.Send(wrap(Resource(OAuthResource::FromHttp(req))));
            ResourceOutcome outcome = async::waitReply(reply, seconds(5));
            if (auto* denied = std::get_if<OAuthResponse>(&outcome)) {
                return denied->ToHttp(req.version());
            }
            OAuthResponse ok;
            ok.BodyText("hello " + std::get<Grant>(outcome).ownerId);
            return ok.ToHttp(req.version());
        });
        ASSERT_NO_THROW({ server->Start().get(); });
    }

    void TearDown() override {
        if (server) { server->Stop().get(); }
        if (worker) { worker->Stop(); }
    }
};

HttpRequest formPost(const std::string& target, const std::string& body) {
    HttpRequest req{http::verb::post, target, 11};
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.body() = body;
    return req;
}

} // namespace

//==========================================================================================================
// Authorization redirect: 302 with Location echoing the code.
//==========================================================================================================
TEST_F(OAuthServerFixture, AuthorizeRedirects) {
    auto res = roundTrip(port, HttpRequest{http::verb::get, "/authorize?code=abc&state=xyz", 11});
    EXPECT_EQ(static_cast<int>(res.result()), 302);
    EXPECT_EQ(std::string(res[http::field::location]), std::string("https://client.example/cb?code=abc"));
}

//==========================================================================================================
// Two Authorization headers: 500 and the engine is never consulted.
//==========================================================================================================
TEST_F(OAuthServerFixture, DuplicateAuthorizationRejectedBeforeDispatch) {
    HttpRequest req{http::verb::get, "/resource", 11};
    req.insert(http::field::authorization, "Bearer tok");
    req.insert(http::field::authorization, "Bearer other");
    auto res = roundTrip(port, req);
    EXPECT_EQ(static_cast<int>(res.result()), 500);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(OAuthServerFixture, ProtocolErrorRendersInternalError) {
    auto res = roundTrip(port, HttpRequest{http::verb::get, "/authorize?state=xyz", 11});
    EXPECT_EQ(static_cast<int>(res.result()), 500);
    EXPECT_EQ(std::string(res[http::field::content_type]), std::string("text/plain"));
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(OAuthServerFixture, TokenReturnsJson) {
    auto res = roundTrip(port, formPost("/token", "grant_type=authorization_code&code=abc"));
    EXPECT_EQ(static_cast<int>(res.result()), 200);
    EXPECT_EQ(std::string(res[http::field::content_type]), std::string("application/json"));
    EXPECT_NE(res.body().find("\"access_token\":\"tok\""), std::string::npos);
}

TEST_F(OAuthServerFixture, TokenWithWrongCodeIsClientError) {
    auto res = roundTrip(port, formPost("/token", "grant_type=authorization_code&code=nope"));
    EXPECT_EQ(static_cast<int>(res.result()), 400);
}

TEST_F(OAuthServerFixture, RefreshReturnsJson) {
    auto res = roundTrip(port, formPost("/refresh", "grant_type=refresh_token&refresh_token=r"));
    EXPECT_EQ(static_cast<int>(res.result()), 200);
    EXPECT_NE(res.body().find("tok2"), std::string::npos);
}

TEST_F(OAuthServerFixture, ResourceWithoutTokenIsUnauthorized) {
    auto res = roundTrip(port, HttpRequest{http::verb::get, "/resource", 11});
    EXPECT_EQ(static_cast<int>(res.result()), 401);
    EXPECT_EQ(std::string(res[http::field::www_authenticate]), std::string("Bearer"));
}

TEST_F(OAuthServerFixture, ResourceWithTokenIsGranted) {
    HttpRequest req{http::verb::get, "/resource", 11};
    req.set(http::field::authorization, "Bearer tok");
    auto res = roundTrip(port, req);
    EXPECT_EQ(static_cast<int>(res.result()), 200);
    EXPECT_EQ(res.body(), std::string("hello owner"));
}

TEST_F(OAuthServerFixture, UnknownPathIsNotFound) {
    auto res = roundTrip(port, HttpRequest{http::verb::get, "/nope", 11});
    EXPECT_EQ(static_cast<int>(res.result()), 404);
}

//==========================================================================================================
// A handler blocked on a slow endpoint does not hold up other connections.
//==========================================================================================================
TEST(HTTPServerConcurrency, SlowHandlerDoesNotBlockOthers) {
    unsigned short port = findFreePort();
    HTTPServer::Options opts; opts.scheme = "http"; opts.address = "127.0.0.1"; opts.port = std::to_string(port);
    opts.handlerThreads = 2;
    HTTPServer server(opts);

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<bool> slowEntered{false};
    server.Route("/slow", [gate, &slowEntered](const HttpRequest& req) {
        slowEntered.store(true);
        gate.wait();
        OAuthResponse ok; ok.BodyText("slow");
        return ok.ToHttp(req.version());
    });
    server.Route("/fast", [](const HttpRequest& req) {
        OAuthResponse ok; ok.BodyText("fast");
        return ok.ToHttp(req.version());
    });
    ASSERT_NO_THROW({ server.Start().get(); });

    auto slow = std::async(std::launch::async, [port] {
        return roundTrip(port, HttpRequest{http::verb::get, "/slow", 11});
    });
    for (int i = 0; i < 200 && !slowEntered.load(); ++i) {
        std::this_thread::sleep_for(milliseconds(5));
    }
    ASSERT_TRUE(slowEntered.load());

    auto fast = roundTrip(port, HttpRequest{http::verb::get, "/fast", 11});
    EXPECT_EQ(fast.body(), std::string("fast"));
    EXPECT_EQ(slow.wait_for(milliseconds(0)), std::future_status::timeout);

    release.set_value();
    EXPECT_EQ(slow.get().body(), std::string("slow"));
    ASSERT_NO_THROW({ server.Stop().get(); });
}
