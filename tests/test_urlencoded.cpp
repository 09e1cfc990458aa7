//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_urlencoded.cpp
// Purpose: Tests for query and form parsing
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "oauthweb/UrlEncoded.hpp"
#include "oauthweb/errors/WebError.hpp"

using namespace oauthweb;

namespace {

HttpRequest makeRequest(const std::string& target, const std::string& contentType, const std::string& body) {
    HttpRequest req{http::verb::post, target, 11};
    if (!contentType.empty()) {
        req.set(http::field::content_type, contentType);
    }
    req.body() = body;
    req.prepare_payload();
    return req;
}

} // namespace

TEST(UrlEncodedTest, DecodesPlusAndPercent) {
    auto r = parseUrlEncoded("redirect_uri=https%3A%2F%2Fa%2Fcb&name=a+b&flag");
    ASSERT_EQ(r.status, ParseStatus::Ok);
    ASSERT_TRUE(r.params.has_value());
    EXPECT_EQ(r.params->UniqueValue("redirect_uri").value(), std::string("https://a/cb"));
    EXPECT_EQ(r.params->UniqueValue("name").value(), std::string("a b"));
    EXPECT_EQ(r.params->UniqueValue("flag").value(), std::string());
}

TEST(UrlEncodedTest, MalformedEscapeIsKeptLiterally) {
    auto r = parseUrlEncoded("a=%zz&b=%4&c=50%&d=ok");
    ASSERT_EQ(r.status, ParseStatus::Ok);
    EXPECT_EQ(r.params->UniqueValue("a").value(), std::string("%zz"));
    EXPECT_EQ(r.params->UniqueValue("b").value(), std::string("%4"));
    EXPECT_EQ(r.params->UniqueValue("c").value(), std::string("50%"));
    EXPECT_EQ(r.params->UniqueValue("d").value(), std::string("ok"));
}

TEST(UrlEncodedTest, InvalidUtf8IsReplaced) {
    auto r = parseUrlEncoded("a=%FF%FE&b=%C3%A9");
    ASSERT_EQ(r.status, ParseStatus::Ok);
    EXPECT_EQ(r.params->UniqueValue("a").value(), std::string("\xEF\xBF\xBD\xEF\xBF\xBD"));
    EXPECT_EQ(r.params->UniqueValue("b").value(), std::string("\xC3\xA9"));
}

TEST(UrlEncodedTest, EmptySegmentsAreSkipped) {
    auto r = parseUrlEncoded("&a=1&&b=2&");
    ASSERT_EQ(r.status, ParseStatus::Ok);
    EXPECT_EQ(r.params->Size(), 2u);
    EXPECT_EQ(r.params->UniqueValue("b").value(), std::string("2"));
}

TEST(UrlEncodedTest, StrayPercentInQueryKeepsOtherParameters) {
    auto r = parseQuery(makeRequest("/authorize?code=abc&state=50%", "", ""));
    ASSERT_EQ(r.status, ParseStatus::Ok);
    EXPECT_EQ(r.params->UniqueValue("code").value(), std::string("abc"));
    EXPECT_EQ(r.params->UniqueValue("state").value(), std::string("50%"));

    auto latin = parseQuery(makeRequest("/authorize?code=abc&state=%FF", "", ""));
    ASSERT_EQ(latin.status, ParseStatus::Ok);
    EXPECT_EQ(latin.params->UniqueValue("code").value(), std::string("abc"));
}

TEST(UrlEncodedTest, UnparseableTargetHasNoQuery) {
    auto r = parseQuery(makeRequest("//a:b/authorize?code=abc", "", ""));
    EXPECT_EQ(r.status, ParseStatus::InvalidTarget);
    EXPECT_FALSE(r.params.has_value());
}

TEST(UrlEncodedTest, TargetWithoutQueryIsEmptyButPresent) {
    auto r = parseQuery(makeRequest("/authorize", "", ""));
    ASSERT_EQ(r.status, ParseStatus::Ok);
    ASSERT_TRUE(r.params.has_value());
    EXPECT_TRUE(r.params->Empty());
}

TEST(UrlEncodedTest, QueryFromTarget) {
    auto r = parseQuery(makeRequest("/authorize?code=abc&state=xyz", "", ""));
    ASSERT_EQ(r.status, ParseStatus::Ok);
    EXPECT_EQ(r.params->UniqueValue("code").value(), std::string("abc"));
    EXPECT_EQ(r.params->UniqueValue("state").value(), std::string("xyz"));
}

TEST(UrlEncodedTest, FormRequiresContentType) {
    EXPECT_EQ(parseForm(makeRequest("/token", "", "a=b")).status, ParseStatus::NotForm);
    EXPECT_EQ(parseForm(makeRequest("/token", "application/json", "{}")).status, ParseStatus::NotForm);
    auto ok = parseForm(makeRequest("/token", "Application/X-WWW-Form-Urlencoded; charset=UTF-8", "grant_type=refresh_token"));
    ASSERT_EQ(ok.status, ParseStatus::Ok);
    EXPECT_EQ(ok.params->UniqueValue("grant_type").value(), std::string("refresh_token"));
}

TEST(UrlEncodedTest, FormRejectsForeignCharsetAndOversizedBody) {
    EXPECT_EQ(parseForm(makeRequest("/token", "application/x-www-form-urlencoded; charset=latin1", "a=b")).status,
              ParseStatus::InvalidEncoding);
    EXPECT_EQ(parseForm(makeRequest("/token", "application/x-www-form-urlencoded", "a=bcdef"), 4).status,
              ParseStatus::TooLarge);
}

TEST(UrlEncodedTest, ExpectParsedMapsFailuresToWebErrorKinds) {
    try {
        (void)expectParsed(ParseResult{ParseStatus::NotForm, std::nullopt});
        FAIL() << "expected WebError";
    } catch (const WebError& e) {
        EXPECT_EQ(e.GetKind(), WebError::Kind::Form);
    }
    try {
        (void)expectParsed(ParseResult{ParseStatus::InvalidEncoding, std::nullopt});
        FAIL() << "expected WebError";
    } catch (const WebError& e) {
        EXPECT_EQ(e.GetKind(), WebError::Kind::Encoding);
    }
    auto params = expectParsed(parseUrlEncoded("k=v"));
    EXPECT_EQ(params.UniqueValue("k").value(), std::string("v"));
}
