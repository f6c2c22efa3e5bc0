#include "outbox/net/health_probe.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

using namespace outbox;
using namespace outbox::net;
using outbox::testing::FakeHttpClient;

class HealthProbeTest : public ::testing::Test {
protected:
    FakeHttpClient client_;
    config::EndpointConfig endpoint_{"user-key", "http://media.local:8080/"};
};

TEST_F(HealthProbeTest, OkStatusMeansAvailable) {
    client_.reply = HttpReply{200, R"({"status":"ok","version":"1.4"})", "application/json"};
    HttpHealthProbe probe(client_, "/_api/v1/health", std::chrono::milliseconds(1500));

    auto status = probe.check(endpoint_);
    EXPECT_TRUE(status.available);
    EXPECT_TRUE(probe.is_available());
    ASSERT_TRUE(client_.last_url.has_value());
    EXPECT_EQ(client_.last_url->to_string(), "http://media.local:8080/_api/v1/health");
    EXPECT_EQ(client_.last_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(client_.gets, 1);
}

TEST_F(HealthProbeTest, OtherStatusValuesAreUnavailable) {
    HttpHealthProbe probe(client_);

    client_.reply = HttpReply{200, R"({"status":"degraded"})", "application/json"};
    EXPECT_FALSE(probe.check(endpoint_).available);

    client_.reply = HttpReply{200, R"({"healthy":true})", "application/json"};
    EXPECT_FALSE(probe.check(endpoint_).available);

    client_.reply = HttpReply{200, "OK", "text/plain"};
    EXPECT_FALSE(probe.check(endpoint_).available);
    EXPECT_FALSE(probe.is_available());
}

TEST_F(HealthProbeTest, ErrorStatusIsUnavailable) {
    client_.reply = HttpReply{503, R"({"status":"ok"})", "application/json"};
    HttpHealthProbe probe(client_);

    auto status = probe.check(endpoint_);
    EXPECT_FALSE(status.available);
    EXPECT_EQ(status.detail, "HTTP 503");
}

TEST_F(HealthProbeTest, TransportFailureIsUnavailable) {
    client_.transport_error = Error{ErrorCode::TransportError, "timed out during connect"};
    client_.delay = std::chrono::milliseconds(30);
    HttpHealthProbe probe(client_);

    auto status = probe.check(endpoint_);
    EXPECT_FALSE(status.available);
    EXPECT_EQ(status.detail, "timed out during connect");
    EXPECT_EQ(status.latency, std::chrono::milliseconds(0));
    EXPECT_EQ(probe.latency(), std::chrono::milliseconds(0));
}

TEST_F(HealthProbeTest, AnsweredCheckReportsRoundTrip) {
    client_.reply = HttpReply{503, "", "text/plain"};
    client_.delay = std::chrono::milliseconds(30);
    HttpHealthProbe probe(client_);

    auto status = probe.check(endpoint_);
    EXPECT_FALSE(status.available);
    EXPECT_GE(status.latency, std::chrono::milliseconds(30));
    EXPECT_EQ(probe.latency(), status.latency);
}

TEST_F(HealthProbeTest, UnusableEndpointSkipsTheRequest) {
    HttpHealthProbe probe(client_);

    auto blank = probe.check(config::EndpointConfig{"k", ""});
    EXPECT_FALSE(blank.available);
    EXPECT_EQ(blank.latency, std::chrono::milliseconds(0));

    auto tls = probe.check(config::EndpointConfig{"k", "https://media.example.org"});
    EXPECT_FALSE(tls.available);
    EXPECT_EQ(client_.gets, 0);
}

TEST_F(HealthProbeTest, CachedResultFollowsLatestCheck) {
    HttpHealthProbe probe(client_);
    EXPECT_FALSE(probe.is_available());

    client_.reply = HttpReply{200, R"({"status":"ok"})", "application/json"};
    probe.check(endpoint_);
    EXPECT_TRUE(probe.is_available());

    client_.transport_error = Error{ErrorCode::TransportError, "refused"};
    probe.check(endpoint_);
    EXPECT_FALSE(probe.is_available());
}
