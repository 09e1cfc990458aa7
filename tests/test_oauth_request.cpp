//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_oauth_request.cpp
// Purpose: Tests for OAuthRequest / OAuthResource extraction
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "oauthweb/OAuthRequest.hpp"

using namespace oauthweb;

namespace {

HttpRequest makeRequest(const std::string& target) {
    HttpRequest req{http::verb::get, target, 11};
    req.set(http::field::host, "localhost");
    return req;
}

} // namespace

TEST(OAuthRequestTest, SingleAuthorizationHeaderPreserved) {
    auto req = makeRequest("/resource");
    req.set(http::field::authorization, "Bearer abc.def");
    OAuthRequest r = OAuthRequest::FromHttp(req);
    ASSERT_TRUE(r.AuthHeader().has_value());
    EXPECT_EQ(r.AuthHeader().value(), std::string("Bearer abc.def"));
}

TEST(OAuthRequestTest, NoAuthorizationHeaderIsNone) {
    OAuthRequest r = OAuthRequest::FromHttp(makeRequest("/resource"));
    EXPECT_FALSE(r.AuthHeader().has_value());
    EXPECT_FALSE(r.AuthorizationHeader().has_value());
}

TEST(OAuthRequestTest, MultipleAuthorizationHeadersFailConstruction) {
    auto req = makeRequest("/resource");
    req.insert(http::field::authorization, "Bearer one");
    req.insert(http::field::authorization, "Bearer two");
    try {
        (void)OAuthRequest::FromHttp(req);
        FAIL() << "expected WebError";
    } catch (const WebError& e) {
        EXPECT_EQ(e.GetKind(), WebError::Kind::Authorization);
    }
}

TEST(OAuthRequestTest, UnparseableBodyDefersError) {
    auto req = makeRequest("/token?grant=1");
    req.method(http::verb::post);
    req.set(http::field::authorization, "Basic Zm9vOmJhcg==");
    req.set(http::field::content_type, "application/json");
    req.body() = "{\"not\":\"a form\"}";
    req.prepare_payload();

    OAuthRequest r = OAuthRequest::FromHttp(req);
    EXPECT_EQ(r.AuthHeader().value(), std::string("Basic Zm9vOmJhcg=="));
    EXPECT_EQ(r.Query().UniqueValue("grant").value(), std::string("1"));
    EXPECT_FALSE(r.BodyParams().has_value());
    try {
        (void)r.UrlBody();
        FAIL() << "expected WebError";
    } catch (const WebError& e) {
        EXPECT_EQ(e.GetKind(), WebError::Kind::Body);
    }
}

TEST(OAuthRequestTest, UnparseableTargetDefersError) {
    OAuthRequest r = OAuthRequest::FromHttp(makeRequest("//a:b/authorize?code=abc"));
    EXPECT_FALSE(r.QueryParams().has_value());
    EXPECT_THROW((void)r.Query(), WebError);
    try {
        (void)r.Query();
    } catch (const WebError& e) {
        EXPECT_EQ(e.GetKind(), WebError::Kind::Query);
    }
}

TEST(OAuthRequestTest, LenientQueryKeepsWellFormedKeys) {
    OAuthRequest r = OAuthRequest::FromHttp(makeRequest("/authorize?code=abc&state=50%"));
    EXPECT_EQ(r.Query().UniqueValue("code").value(), std::string("abc"));
    EXPECT_EQ(r.Query().UniqueValue("state").value(), std::string("50%"));
}

TEST(OAuthRequestTest, FormBodyParsed) {
    auto req = makeRequest("/token");
    req.method(http::verb::post);
    req.set(http::field::content_type, "application/x-www-form-urlencoded");
    req.body() = "grant_type=authorization_code&code=abc";
    req.prepare_payload();
    OAuthRequest r = OAuthRequest::FromHttp(req);
    EXPECT_EQ(r.UrlBody().UniqueValue("code").value(), std::string("abc"));
    EXPECT_TRUE(r.Query().Empty());
}

TEST(OAuthRequestTest, QueryIsMutable) {
    OAuthRequest r = OAuthRequest::FromHttp(makeRequest("/authorize?a=1"));
    ASSERT_TRUE(r.MutableQuery().has_value());
    r.MutableQuery()->Insert("b", "2");
    EXPECT_EQ(r.Query().UniqueValue("b").value(), std::string("2"));
}

TEST(OAuthResourceTest, ReadsOnlyAuthorization) {
    auto req = makeRequest("/api?x=%ZZ");
    req.method(http::verb::post);
    req.set(http::field::authorization, "Bearer tok");
    req.set(http::field::content_type, "application/octet-stream");
    req.body() = "raw payload";
    req.prepare_payload();

    OAuthResource res = OAuthResource::FromHttp(req);
    EXPECT_EQ(res.AuthorizationHeader().value(), std::string("Bearer tok"));
    EXPECT_EQ(req.body(), std::string("raw payload"));

    OAuthRequest full = std::move(res);
    EXPECT_EQ(full.AuthHeader().value(), std::string("Bearer tok"));
    EXPECT_FALSE(full.QueryParams().has_value());
    EXPECT_FALSE(full.BodyParams().has_value());
    EXPECT_THROW((void)full.Query(), WebError);
    EXPECT_THROW((void)full.UrlBody(), WebError);
}

TEST(OAuthResourceTest, MultipleAuthorizationHeadersRejected) {
    auto req = makeRequest("/api");
    req.insert(http::field::authorization, "Bearer a");
    req.insert(http::field::authorization, "Bearer b");
    EXPECT_THROW((void)OAuthResource::FromHttp(req), WebError);
}
