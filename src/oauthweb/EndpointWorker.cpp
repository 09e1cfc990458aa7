//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthweb/EndpointWorker.cpp
// Purpose: EndpointWorker mailbox and consumer thread
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <thread>

#include "logging/Logger.h"
#include "oauthweb/EndpointWorker.hpp"

namespace oauthweb {

class EndpointWorker::Impl {
public:
    std::unique_ptr<IEndpoint> endpoint;
    EndpointWorker::Options opts;
    std::atomic<bool> running{false};
    mutable std::mutex queueMutex;
    std::condition_variable queueCondition;
    std::deque<std::unique_ptr<IJob>> mailbox;
    std::jthread consumer;

    Impl(std::unique_ptr<IEndpoint> e, EndpointWorker::Options o)
        : endpoint(std::move(e)), opts(std::move(o)) {
        opts.capacity = std::max<std::size_t>(opts.capacity, 1);
    }

    void startProcessing() {
        consumer = std::jthread([this](std::stop_token st) {
            for (;;) {
                std::unique_ptr<IJob> job;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    queueCondition.wait(lock, [this, &st]() { return !mailbox.empty() || st.stop_requested(); });
                    if (st.stop_requested()) {
                        break;
                    }
                    job = std::move(mailbox.front());
                    mailbox.pop_front();
                }
                job->Run(*endpoint);
            }
        });
    }

    void rejectPending() {
        std::deque<std::unique_ptr<IJob>> dropped;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            dropped.swap(mailbox);
        }
        if (!dropped.empty()) {
            LOG_WARN("Worker '{}' stopped with {} queued message(s); canceling them", opts.name, dropped.size());
        }
        for (auto& job : dropped) {
            job->Fail(std::make_exception_ptr(WebError(WebError::Kind::Canceled, "worker stopped")));
        }
    }
};

EndpointWorker::EndpointWorker(std::unique_ptr<IEndpoint> endpoint)
    : EndpointWorker(std::move(endpoint), Options()) {}

EndpointWorker::EndpointWorker(std::unique_ptr<IEndpoint> endpoint, Options opts)
    : pImpl(std::make_unique<Impl>(std::move(endpoint), std::move(opts))) {}

EndpointWorker::~EndpointWorker() {
    Stop();
}

void EndpointWorker::Start() {
    FUNC_SCOPE();
    bool expected = false;
    if (!pImpl->running.compare_exchange_strong(expected, true)) {
        return;
    }
    LOG_INFO("Starting worker '{}' (mailbox capacity {})", pImpl->opts.name, pImpl->opts.capacity);
    pImpl->startProcessing();
}

void EndpointWorker::Stop() {
    FUNC_SCOPE();
    bool expected = true;
    if (!pImpl->running.compare_exchange_strong(expected, false)) {
        return;
    }
    LOG_INFO("Stopping worker '{}'", pImpl->opts.name);
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        pImpl->consumer.request_stop();
    }
    pImpl->queueCondition.notify_all();
    if (pImpl->consumer.joinable()) {
        pImpl->consumer.join();
    }
    pImpl->rejectPending();
}

bool EndpointWorker::IsRunning() const {
    return pImpl->running.load();
}

std::size_t EndpointWorker::Pending() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->mailbox.size();
}

void EndpointWorker::enqueue(std::unique_ptr<IJob> job) {
    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);
        if (pImpl->running.load() && pImpl->mailbox.size() < pImpl->opts.capacity) {
            pImpl->mailbox.push_back(std::move(job));
            pImpl->queueCondition.notify_one();
            return;
        }
    }
    const MailboxError reason = pImpl->running.load() ? MailboxError::Full : MailboxError::Closed;
    LOG_WARN("Worker '{}' rejected message: {}", pImpl->opts.name,
             reason == MailboxError::Full ? "mailbox full" : "mailbox closed");
    job->Fail(std::make_exception_ptr(WebError::fromMailbox(reason)));
}

} // namespace oauthweb
