#include "outbox/config/config.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace outbox;
using namespace outbox::config;

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    auto parsed = parse_config("{}");
    ASSERT_TRUE(parsed.is_ok());

    const auto& config = parsed.value();
    EXPECT_EQ(config.data_dir, std::filesystem::path("outbox_data"));
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.processor.max_retries, 3u);
    EXPECT_EQ(config.processor.process_interval, std::chrono::milliseconds(2000));
    EXPECT_TRUE(config.processor.require_unmetered);
    EXPECT_EQ(config.health.path, "/_api/v1/health");
    EXPECT_EQ(config.health.timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.upload.path, "/_api/v1/upload");
    EXPECT_EQ(config.upload.timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(config.connectivity.sysfs_root, std::filesystem::path("/sys/class/net"));
    EXPECT_EQ(config.connectivity.metered_interfaces.size(), 4u);
}

TEST(ConfigTest, SectionsOverrideIndividually) {
    auto parsed = parse_config(R"({
        "data_dir": "/var/lib/outbox",
        "log_level": "debug",
        "processor": {"max_retries": 5, "require_unmetered": false},
        "upload": {"timeout_ms": 30000},
        "connectivity": {"metered_interfaces": ["wwan"]}
    })");
    ASSERT_TRUE(parsed.is_ok());

    const auto& config = parsed.value();
    EXPECT_EQ(config.data_dir, std::filesystem::path("/var/lib/outbox"));
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.processor.max_retries, 5u);
    EXPECT_EQ(config.processor.process_interval, std::chrono::milliseconds(2000));
    EXPECT_FALSE(config.processor.require_unmetered);
    EXPECT_EQ(config.upload.timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(config.upload.path, "/_api/v1/upload");
    ASSERT_EQ(config.connectivity.metered_interfaces.size(), 1u);
    EXPECT_EQ(config.connectivity.metered_interfaces[0], "wwan");
}

TEST(ConfigTest, NonObjectDocumentIsParseError) {
    auto parsed = parse_config("[1, 2]");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);

    auto garbage = parse_config("not json");
    ASSERT_TRUE(garbage.is_error());
    EXPECT_EQ(garbage.error().code, ErrorCode::Parse);
}

TEST(ConfigTest, WrongTypeIsParseError) {
    auto parsed = parse_config(R"({"processor": {"max_retries": "three"}})");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::Parse);
}

TEST(ConfigTest, NegativeDurationIsRejected) {
    auto parsed = parse_config(R"({"health": {"timeout_ms": -1}})");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, PathsMustBeAbsolute) {
    auto parsed = parse_config(R"({"upload": {"path": "upload"}})");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.error().code, ErrorCode::InvalidArgument);
}

TEST(ConfigTest, LoadFromDisk) {
    const auto dir = outbox::testing::create_temp_dir("outbox_config_test");
    const auto file = dir / "outbox.json";
    outbox::testing::write_file(file, R"({"log_level": "warn"})");

    auto loaded = load_config(file);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().log_level, "warn");

    auto missing = load_config(dir / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    std::filesystem::remove_all(dir);
}
