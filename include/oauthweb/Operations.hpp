//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Operations.hpp
// Purpose: Single-use protocol operations run against an IEndpoint, and their dispatch envelope
//==========================================================================================================

#pragma once

#include <concepts>
#include <utility>
#include <variant>

#include "oauthweb/Endpoint.hpp"
#include "oauthweb/OAuthRequest.hpp"
#include "oauthweb/OAuthResponse.hpp"

namespace oauthweb {

//==========================================================================================================
// OAuthOperation
// Purpose: A value describing one protocol step. Run() is rvalue-qualified: running consumes the operation,
//          so a second run is not expressible without an explicit (and unsupported) use-after-move.
// Errors:
//   Run() throws WebError. EndpointError from the engine is converted to WebError (Endpoint); WebError from
//   the request/response capabilities passes through unchanged.
//==========================================================================================================
template <typename Op>
concept OAuthOperation = std::move_constructible<Op> && requires(Op op, IEndpoint& endpoint) {
    typename Op::Item;
    { std::move(op).Run(endpoint) } -> std::same_as<typename Op::Item>;
};

// Authorization request (front channel).
class Authorize {
public:
    using Item = OAuthResponse;
    explicit Authorize(OAuthRequest request) : request(std::move(request)) {}
    Authorize(Authorize&&) = default;
    Authorize& operator=(Authorize&&) = default;
    Authorize(const Authorize&) = delete;
    Authorize& operator=(const Authorize&) = delete;

    Item Run(IEndpoint& endpoint) &&;

private:
    OAuthRequest request;
};

// Access token request (authorization code exchange).
class Token {
public:
    using Item = OAuthResponse;
    explicit Token(OAuthRequest request) : request(std::move(request)) {}
    Token(Token&&) = default;
    Token& operator=(Token&&) = default;
    Token(const Token&) = delete;
    Token& operator=(const Token&) = delete;

    Item Run(IEndpoint& endpoint) &&;

private:
    OAuthRequest request;
};

// Refresh token request.
class Refresh {
public:
    using Item = OAuthResponse;
    explicit Refresh(OAuthRequest request) : request(std::move(request)) {}
    Refresh(Refresh&&) = default;
    Refresh& operator=(Refresh&&) = default;
    Refresh(const Refresh&) = delete;
    Refresh& operator=(const Refresh&) = delete;

    Item Run(IEndpoint& endpoint) &&;

private:
    OAuthRequest request;
};

// Outcome of a resource check: the grant, or the denial response to send.
using ResourceOutcome = std::variant<Grant, OAuthResponse>;

// Resource guard check.
class Resource {
public:
    using Item = ResourceOutcome;
    explicit Resource(OAuthRequest request) : request(std::move(request)) {}
    explicit Resource(OAuthResource resource) : request(std::move(resource).IntoRequest()) {}
    Resource(Resource&&) = default;
    Resource& operator=(Resource&&) = default;
    Resource(const Resource&) = delete;
    Resource& operator=(const Resource&) = delete;

    Item Run(IEndpoint& endpoint) &&;

private:
    OAuthRequest request;
};

//==========================================================================================================
// OperationMessage
// Purpose: Envelope carrying an operation across the worker boundary. It adds no information and loses
//          none; IntoInner() returns the original operation.
//==========================================================================================================
template <OAuthOperation Op>
class OperationMessage {
public:
    using Operation = Op;
    using Item = typename Op::Item;

    explicit OperationMessage(Op op) : op(std::move(op)) {}

    Op IntoInner() && { return std::move(op); }

private:
    Op op;
};

template <OAuthOperation Op>
OperationMessage<Op> wrap(Op op) {
    return OperationMessage<Op>(std::move(op));
}

} // namespace oauthweb
