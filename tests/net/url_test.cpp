#include "outbox/net/url.hpp"

#include <gtest/gtest.h>

using namespace outbox;
using namespace outbox::net;

TEST(UrlTest, ParsesHostPortAndTarget) {
    auto url = parse_url("http://media.local:8080/_api/v1/upload");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "media.local");
    EXPECT_EQ(url.value().port, 8080);
    EXPECT_EQ(url.value().target, "/_api/v1/upload");
    EXPECT_EQ(url.value().host_header(), "media.local:8080");
    EXPECT_EQ(url.value().to_string(), "http://media.local:8080/_api/v1/upload");
}

TEST(UrlTest, DefaultsPortAndTarget) {
    auto url = parse_url("http://10.0.0.2");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().port, 80);
    EXPECT_EQ(url.value().target, "/");
    EXPECT_EQ(url.value().host_header(), "10.0.0.2");
}

TEST(UrlTest, BracketedIpv6) {
    auto url = parse_url("http://[::1]:9000/health");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().host, "::1");
    EXPECT_EQ(url.value().port, 9000);
    EXPECT_EQ(url.value().host_header(), "[::1]:9000");
}

TEST(UrlTest, RejectsMalformedInput) {
    EXPECT_EQ(parse_url("ftp://host/").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_url("http://").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_url("http://host:http/").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_url("http://host:70000/").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_url("http://host:0/").error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(parse_url("http://[::1/").error().code, ErrorCode::InvalidArgument);
}

TEST(UrlTest, TlsIsTreatedAsMissingConfiguration) {
    auto url = parse_url("https://media.example.org");
    ASSERT_TRUE(url.is_error());
    EXPECT_EQ(url.error().code, ErrorCode::ConfigurationMissing);
}

TEST(UrlTest, NormalizeBaseUrl) {
    EXPECT_EQ(normalize_base_url("media.local:8080/"), "http://media.local:8080");
    EXPECT_EQ(normalize_base_url("  http://media.local//  "), "http://media.local");
    EXPECT_EQ(normalize_base_url("https://media.local"), "https://media.local");
    EXPECT_EQ(normalize_base_url("   "), "");
    EXPECT_EQ(strip_trailing_slashes("a///"), "a");
}

TEST(UrlTest, EndpointUrlJoinsPath) {
    auto url = endpoint_url("media.local/", "/_api/v1/health");
    ASSERT_TRUE(url.is_ok());
    EXPECT_EQ(url.value().to_string(), "http://media.local/_api/v1/health");

    auto blank = endpoint_url("", "/_api/v1/health");
    ASSERT_TRUE(blank.is_error());
    EXPECT_EQ(blank.error().code, ErrorCode::ConfigurationMissing);
}
