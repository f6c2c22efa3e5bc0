#include "outbox/core/result.hpp"
#include "outbox/core/time.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using namespace outbox;

TEST(ResultTest, OkCarriesValue) {
    auto result = Ok(std::string("payload"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "payload");
    EXPECT_EQ(result.value_or("other"), "payload");
}

TEST(ResultTest, FailCarriesCodeAndMessage) {
    auto result = Fail<int>(ErrorCode::ServerRejected, "HTTP 403");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ServerRejected);
    EXPECT_EQ(result.error().message, "HTTP 403");
    EXPECT_EQ(result.value_or(7), 7);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> failed = Fail<void>(ErrorCode::Storage, "disk full");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, ErrorCode::Storage);
}

TEST(ErrorCodeTest, TransientClassification) {
    EXPECT_TRUE(is_transient(ErrorCode::ServerError));
    EXPECT_TRUE(is_transient(ErrorCode::TransportError));
    EXPECT_TRUE(is_transient(ErrorCode::ResponseUnparseable));
    EXPECT_FALSE(is_transient(ErrorCode::ServerRejected));
    EXPECT_FALSE(is_transient(ErrorCode::PayloadMissing));
    EXPECT_FALSE(is_transient(ErrorCode::ConfigurationMissing));
    EXPECT_STREQ(to_string(ErrorCode::PayloadMissing), "payload_missing");
}

TEST(IdGeneratorTest, StrictlyIncreasingAcrossThreads) {
    IdGenerator ids;
    std::vector<std::int64_t> stamps[4];
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 250; ++i) {
                stamps[t].push_back(ids.next());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::int64_t> unique;
    for (const auto& list : stamps) {
        for (std::size_t i = 1; i < list.size(); ++i) {
            EXPECT_LT(list[i - 1], list[i]);
        }
        unique.insert(list.begin(), list.end());
    }
    EXPECT_EQ(unique.size(), 1000u);
}

TEST(IdGeneratorTest, ObserveSkipsPastStamp) {
    IdGenerator ids;
    const auto future = now_ms() + 60000;
    ids.observe(future);
    EXPECT_GT(ids.next(), future);
}
