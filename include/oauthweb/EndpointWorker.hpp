//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EndpointWorker.hpp
// Purpose: Single-consumer worker owning a long-lived endpoint and executing dispatched operations
//==========================================================================================================

#pragma once

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>

#include "env/EnvVars.h"
#include "oauthweb/Endpoint.hpp"
#include "oauthweb/Operations.hpp"

namespace oauthweb {

//==========================================================================================================
// EndpointWorker
// Purpose: Owns an IEndpoint (token store, client registry, ...) and runs operations against it on one
//          background thread. Operations arrive through a bounded mailbox and are processed in submission
//          order.
// Notes:
//   - Send() never blocks. A full mailbox or a stopped worker fails the returned future with
//     WebError (Mailbox).
//   - Stop() fails queued, not yet processed messages with WebError (Canceled).
//==========================================================================================================
class EndpointWorker {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   capacity: Maximum number of queued messages (OAUTHWEB_MAILBOX_CAPACITY, default 16, minimum 1).
    //   name: Label used in logs.
    //==========================================================================================================
    struct Options {
        std::size_t capacity{GetEnvSizeOrDefault("OAUTHWEB_MAILBOX_CAPACITY", 16)};
        std::string name{"endpoint"};
    };

    explicit EndpointWorker(std::unique_ptr<IEndpoint> endpoint);
    EndpointWorker(std::unique_ptr<IEndpoint> endpoint, Options opts);
    ~EndpointWorker();

    EndpointWorker(const EndpointWorker&) = delete;
    EndpointWorker& operator=(const EndpointWorker&) = delete;

    // Starts the consumer thread. Idempotent.
    void Start();

    // Closes the mailbox and joins the consumer thread. Idempotent.
    void Stop();

    bool IsRunning() const;

    // Number of queued messages not yet picked up by the consumer.
    std::size_t Pending() const;

    //==========================================================================================================
    // Send
    // Purpose: Dispatch an operation to the worker.
    // Returns:
    //   Future receiving exactly one reply: the operation's Item or its WebError.
    //==========================================================================================================
    template <OAuthOperation Op>
    std::future<typename Op::Item> Send(OperationMessage<Op> message) {
        auto job = std::make_unique<MessageJob<Op>>(std::move(message).IntoInner());
        auto fut = job->GetFuture();
        enqueue(std::move(job));
        return fut;
    }

private:
    class IJob {
    public:
        virtual ~IJob() = default;
        virtual void Run(IEndpoint& endpoint) = 0;
        virtual void Fail(std::exception_ptr error) = 0;
    };

    template <OAuthOperation Op>
    class MessageJob : public IJob {
    public:
        explicit MessageJob(Op op) : op(std::move(op)) {}

        std::future<typename Op::Item> GetFuture() { return promise.get_future(); }

        void Run(IEndpoint& endpoint) override {
            try {
                promise.set_value(std::move(op).Run(endpoint));
            } catch (...) {
                promise.set_exception(std::current_exception());
            }
        }

        void Fail(std::exception_ptr error) override { promise.set_exception(error); }

    private:
        Op op;
        std::promise<typename Op::Item> promise;
    };

    void enqueue(std::unique_ptr<IJob> job);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace oauthweb
