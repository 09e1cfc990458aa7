//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/oauth_server/main.cpp
// Purpose: Demo wiring of a toy endpoint behind an EndpointWorker and HTTPServer routes
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include "DemoEndpoint.hpp"
#include "logging/Logger.h"
#include "oauthweb/EndpointWorker.hpp"
#include "oauthweb/HTTPServer.hpp"
#include "oauthweb/OAuthRequest.hpp"
#include "oauthweb/Operations.hpp"
#include "oauthweb/async/Reply.hpp"
#include "oauthweb/version.h"

using namespace oauthweb;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

namespace {

template <typename Op>
HttpResponse dispatch(EndpointWorker& worker, Op op, unsigned int version) {
    auto reply = worker.Send(wrap(std::move(op)));
    OAuthResponse res = async::waitReply(reply, std::chrono::seconds(5));
    return res.ToHttp(version);
}

} // namespace

int main(int argc, char** argv) {
    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);
    Logger::initFromEnv();

    const std::string config = (argc > 1) ? std::string(argv[1]) : std::string("http://127.0.0.1:8020");
    LOG_INFO("oauthweb demo server {} starting with '{}'", getVersionString(), config);

    EndpointWorker worker(std::make_unique<demo::DemoEndpoint>());
    worker.Start();

    HTTPServerFactory factory;
    auto server = factory.Create(config);
    server->SetErrorHandler([](const std::string& err) { LOG_ERROR("{}", err); });

    server->Route("/authorize", [&worker](const HttpRequest& req) {
        return dispatch(worker, Authorize(OAuthRequest::FromHttp(req)), req.version());
    });
    server->Route("/token", [&worker](const HttpRequest& req) {
        return dispatch(worker, Token(OAuthRequest::FromHttp(req)), req.version());
    });
    server->Route("/refresh", [&worker](const HttpRequest& req) {
        return dispatch(worker, Refresh(OAuthRequest::FromHttp(req)), req.version());
    });
    server->Route("/resource", [&worker](const HttpRequest& req) {
        auto reply = worker.Send(wrap(Resource(OAuthResource::FromHttp(req))));
        ResourceOutcome outcome = async::waitReply(reply, std::chrono::seconds(5));
        if (auto* denied = std::get_if<OAuthResponse>(&outcome)) {
            return denied->ToHttp(req.version());
        }
        const Grant& grant = std::get<Grant>(outcome);
        OAuthResponse ok;
        ok.BodyText("Hello " + grant.ownerId);
        return ok.ToHttp(req.version());
    });

    server->Start().get();
    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server->Stop().get();
    worker.Stop();
    return 0;
}
