//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Reply.hpp
// Purpose: Waiting on single replies from background execution and running blocking work off the I/O thread
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "oauthweb/errors/WebError.hpp"

namespace oauthweb {
namespace async {

//==========================================================================================================
// waitReply
// Purpose: Wait for exactly one reply.
// Args:
//   reply: Future obtained from EndpointWorker::Send or runBlocking.
//   timeout: Maximum time to wait.
// Returns:
//   The reply value.
// Throws:
//   WebError (Canceled) on timeout or when the producer dropped the reply; otherwise the reply's own error.
//==========================================================================================================
template <typename T>
T waitReply(std::future<T>& reply, std::chrono::milliseconds timeout) {
    if (!reply.valid()) {
        throw WebError(WebError::Kind::Canceled, "no reply pending");
    }
    if (reply.wait_for(timeout) != std::future_status::ready) {
        throw WebError::fromMailbox(MailboxError::Timeout);
    }
    try {
        return reply.get();
    } catch (const std::future_error& e) {
        throw WebError::fromFutureError(e);
    }
}

//==========================================================================================================
// runBlocking
// Purpose: Run fn on a thread pool and return its result as a future. Work discarded by a stopped pool
//          surfaces as WebError (Canceled) through waitReply.
//==========================================================================================================
template <typename Fn>
std::future<std::invoke_result_t<Fn>> runBlocking(boost::asio::thread_pool& pool, Fn fn) {
    using R = std::invoke_result_t<Fn>;
    std::packaged_task<R()> task(std::move(fn));
    auto fut = task.get_future();
    boost::asio::post(pool, std::move(task));
    return fut;
}

} // namespace async
} // namespace oauthweb
