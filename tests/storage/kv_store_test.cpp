#include "outbox/storage/kv_store.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using outbox::storage::FileKeyValueStore;
using outbox::storage::MemoryKeyValueStore;

namespace {

using Stored = outbox::Result<std::optional<std::string>>;

Stored append_char(const std::optional<std::string>& current, char c) {
    return outbox::Ok(std::optional<std::string>(current.value_or("") + c));
}

} // namespace

class FileKeyValueStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = outbox::testing::create_temp_dir("outbox_kv_test");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    fs::path root_;
};

TEST_F(FileKeyValueStoreTest, MissingKeyIsNulloptNotError) {
    FileKeyValueStore kv(root_);
    auto value = kv.get("@upload_queue");
    ASSERT_TRUE(value.is_ok());
    EXPECT_FALSE(value.value().has_value());
}

TEST_F(FileKeyValueStoreTest, SetThenGetSurvivesReopen) {
    {
        FileKeyValueStore kv(root_);
        ASSERT_TRUE(kv.set("@upload_queue", "[1,2,3]").is_ok());
        ASSERT_TRUE(kv.set("@upload_queue", "[4]").is_ok());
    }

    FileKeyValueStore reopened(root_);
    auto value = reopened.get("@upload_queue");
    ASSERT_TRUE(value.is_ok());
    ASSERT_TRUE(value.value().has_value());
    EXPECT_EQ(*value.value(), "[4]");
}

TEST_F(FileKeyValueStoreTest, KeysAreSanitisedIntoFileNames) {
    FileKeyValueStore kv(root_);
    ASSERT_TRUE(kv.set("@app/settings", "{}").is_ok());
    EXPECT_TRUE(fs::exists(root_ / "_app_settings.json"));

    for (const auto& entry : fs::directory_iterator(root_)) {
        EXPECT_NE(entry.path().extension(), ".tmp");
    }
}

TEST_F(FileKeyValueStoreTest, RemoveDeletesValue) {
    FileKeyValueStore kv(root_);
    ASSERT_TRUE(kv.set("k", "v").is_ok());
    ASSERT_TRUE(kv.remove("k").is_ok());
    EXPECT_FALSE(kv.get("k").value().has_value());
    EXPECT_TRUE(kv.remove("k").is_ok());
}

TEST_F(FileKeyValueStoreTest, UpdateSeesWritesFromAnotherStore) {
    FileKeyValueStore first(root_);
    FileKeyValueStore second(root_);

    ASSERT_TRUE(first.update("k", [](const auto& current) { return append_char(current, 'a'); }).is_ok());
    ASSERT_TRUE(second.update("k", [](const auto& current) { return append_char(current, 'b'); }).is_ok());
    ASSERT_TRUE(first.update("k", [](const auto& current) { return append_char(current, 'c'); }).is_ok());

    EXPECT_EQ(*first.get("k").value(), "abc");
    EXPECT_TRUE(fs::exists(root_ / "outbox.lock"));
}

TEST_F(FileKeyValueStoreTest, UpdateCanLeaveValueUntouched) {
    FileKeyValueStore kv(root_);
    ASSERT_TRUE(kv.set("k", "kept").is_ok());

    auto skipped = kv.update("k", [](const std::optional<std::string>&) -> Stored {
        return outbox::Ok(std::optional<std::string>{});
    });
    EXPECT_TRUE(skipped.is_ok());

    auto rejected = kv.update("k", [](const std::optional<std::string>&) -> Stored {
        return outbox::Fail<std::optional<std::string>>(outbox::ErrorCode::InvalidArgument, "no");
    });
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, outbox::ErrorCode::InvalidArgument);
    EXPECT_EQ(*kv.get("k").value(), "kept");
}

TEST(MemoryKeyValueStoreTest, UpdateHonoursFailingWrites) {
    MemoryKeyValueStore kv;
    ASSERT_TRUE(kv.update("k", [](const auto& current) { return append_char(current, 'a'); }).is_ok());
    EXPECT_EQ(*kv.get("k").value(), "a");

    kv.set_fail_writes(true);
    auto failed = kv.update("k", [](const auto& current) { return append_char(current, 'b'); });
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, outbox::ErrorCode::Storage);
    EXPECT_EQ(*kv.get("k").value(), "a");
    EXPECT_EQ(kv.write_count(), 1u);
}

TEST(MemoryKeyValueStoreTest, FailingWritesLeaveOldValue) {
    MemoryKeyValueStore kv;
    ASSERT_TRUE(kv.set("k", "old").is_ok());
    kv.set_fail_writes(true);

    auto failed = kv.set("k", "new");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, outbox::ErrorCode::Storage);
    EXPECT_EQ(*kv.get("k").value(), "old");
    EXPECT_EQ(kv.write_count(), 1u);
}
