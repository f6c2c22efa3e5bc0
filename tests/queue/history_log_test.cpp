#include "outbox/queue/history_log.hpp"

#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace outbox::queue;
using outbox::storage::FileKeyValueStore;
using outbox::storage::MemoryKeyValueStore;

namespace {

HistoryEntry make_entry(const std::string& id, ItemStatus status) {
    HistoryEntry entry;
    entry.id = id;
    entry.timestamp = std::stoll(id);
    entry.status = status;
    return entry;
}

} // namespace

class HistoryLogTest : public ::testing::Test {
protected:
    MemoryKeyValueStore kv_;
    HistoryLog log_{kv_};
};

TEST_F(HistoryLogTest, InsertIfAbsentOnlyOnce) {
    auto first = log_.insert_if_absent(make_entry("1", ItemStatus::Pending));
    ASSERT_TRUE(first.is_ok());
    EXPECT_TRUE(first.value());

    auto second = log_.insert_if_absent(make_entry("1", ItemStatus::Failed));
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value());
    EXPECT_EQ(log_.get("1")->status, ItemStatus::Pending);
}

TEST_F(HistoryLogTest, ProgressIsClampedAndMonotonic) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Pending)).is_ok());

    // Ignored until the entry is uploading.
    ASSERT_TRUE(log_.update_progress("1", 40).is_ok());
    EXPECT_FALSE(log_.get("1")->progress.has_value());

    ASSERT_TRUE(log_.mark_uploading("1").is_ok());
    ASSERT_TRUE(log_.update_progress("1", 40).is_ok());
    ASSERT_TRUE(log_.update_progress("1", 30).is_ok());
    EXPECT_EQ(log_.get("1")->progress, std::optional<int>(40));

    ASSERT_TRUE(log_.update_progress("1", 250).is_ok());
    EXPECT_EQ(log_.get("1")->progress, std::optional<int>(100));
}

TEST_F(HistoryLogTest, TerminalTransitions) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Pending)).is_ok());
    ASSERT_TRUE(log_.insert_if_absent(make_entry("2", ItemStatus::Pending)).is_ok());

    ASSERT_TRUE(log_.mark_uploading("1").is_ok());
    ASSERT_TRUE(log_.mark_completed("1").is_ok());
    ASSERT_TRUE(log_.mark_failed("2", "Invalid permissions: HTTP 403").is_ok());

    EXPECT_EQ(log_.get("1")->status, ItemStatus::Completed);
    EXPECT_EQ(log_.get("1")->progress, std::optional<int>(100));
    EXPECT_EQ(log_.get("2")->status, ItemStatus::Failed);
    EXPECT_EQ(log_.get("2")->error, std::optional<std::string>("Invalid permissions: HTTP 403"));
}

TEST_F(HistoryLogTest, MarkPendingKeepsReasonAndClearsProgress) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Pending)).is_ok());
    ASSERT_TRUE(log_.mark_uploading("1").is_ok());
    ASSERT_TRUE(log_.update_progress("1", 60).is_ok());
    ASSERT_TRUE(log_.mark_pending("1", std::string("timed out during read response")).is_ok());

    const auto entry = log_.get("1");
    EXPECT_EQ(entry->status, ItemStatus::Pending);
    EXPECT_FALSE(entry->progress.has_value());
    EXPECT_EQ(entry->error, std::optional<std::string>("timed out during read response"));
}

TEST_F(HistoryLogTest, ReconcileFailsOrphansOnly) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Uploading)).is_ok());
    ASSERT_TRUE(log_.insert_if_absent(make_entry("2", ItemStatus::Pending)).is_ok());
    ASSERT_TRUE(log_.insert_if_absent(make_entry("3", ItemStatus::Pending)).is_ok());
    ASSERT_TRUE(log_.insert_if_absent(make_entry("4", ItemStatus::Completed)).is_ok());

    auto repaired = log_.reconcile({"3"});
    ASSERT_TRUE(repaired.is_ok());
    EXPECT_EQ(repaired.value(), 2u);

    EXPECT_EQ(log_.get("1")->status, ItemStatus::Failed);
    EXPECT_EQ(log_.get("1")->error, std::optional<std::string>(HistoryLog::kInterruptedReason));
    EXPECT_EQ(log_.get("2")->status, ItemStatus::Failed);
    EXPECT_EQ(log_.get("3")->status, ItemStatus::Pending);
    EXPECT_EQ(log_.get("4")->status, ItemStatus::Completed);
}

TEST_F(HistoryLogTest, ReconcileIsIdempotent) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Uploading)).is_ok());
    ASSERT_TRUE(log_.reconcile({}).is_ok());
    const auto once = log_.entries();
    const auto writes = kv_.write_count();

    auto again = log_.reconcile({});
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 0u);
    EXPECT_EQ(kv_.write_count(), writes);

    const auto twice = log_.entries();
    ASSERT_EQ(once.size(), twice.size());
    EXPECT_EQ(once[0].status, twice[0].status);
    EXPECT_EQ(once[0].error, twice[0].error);
}

TEST_F(HistoryLogTest, ClearDropsEverythingAndPersists) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Completed)).is_ok());
    ASSERT_TRUE(log_.clear().is_ok());
    EXPECT_EQ(log_.size(), 0u);

    HistoryLog reloaded(kv_);
    ASSERT_TRUE(reloaded.load().is_ok());
    EXPECT_EQ(reloaded.size(), 0u);
}

TEST_F(HistoryLogTest, ReconcileWithReadsIdsUnderTheLock) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Uploading)).is_ok());
    ASSERT_TRUE(log_.insert_if_absent(make_entry("2", ItemStatus::Pending)).is_ok());

    int calls = 0;
    auto repaired = log_.reconcile_with([&]() -> outbox::Result<std::unordered_set<std::string>> {
        ++calls;
        // Reading the store from inside the update must not deadlock.
        EXPECT_TRUE(kv_.get(HistoryLog::kStorageKey).is_ok());
        return outbox::Ok(std::unordered_set<std::string>{"2"});
    });
    ASSERT_TRUE(repaired.is_ok());
    EXPECT_EQ(repaired.value(), 1u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(log_.get("1")->status, ItemStatus::Failed);
    EXPECT_EQ(log_.get("2")->status, ItemStatus::Pending);
}

TEST_F(HistoryLogTest, ReconcileWithPropagatesIdError) {
    ASSERT_TRUE(log_.insert_if_absent(make_entry("1", ItemStatus::Uploading)).is_ok());
    auto repaired = log_.reconcile_with([]() {
        return outbox::Fail<std::unordered_set<std::string>>(outbox::ErrorCode::Parse, "bad queue");
    });
    ASSERT_TRUE(repaired.is_error());
    EXPECT_EQ(repaired.error().code, outbox::ErrorCode::Parse);
    EXPECT_EQ(log_.get("1")->status, ItemStatus::Uploading);
}

TEST(HistoryLogSharedDirTest, EntriesFromAnotherLogSurvive) {
    const auto root = outbox::testing::create_temp_dir("outbox_history_shared_test");
    {
        FileKeyValueStore runner_kv(root);
        FileKeyValueStore cli_kv(root);
        HistoryLog runner(runner_kv);
        HistoryLog cli(cli_kv);

        ASSERT_TRUE(runner.insert_if_absent(make_entry("100", ItemStatus::Pending)).is_ok());
        ASSERT_TRUE(cli.load().is_ok());
        ASSERT_TRUE(cli.insert_if_absent(make_entry("200", ItemStatus::Pending)).is_ok());
        ASSERT_TRUE(runner.mark_completed("100").is_ok());

        HistoryLog reopened(runner_kv);
        ASSERT_TRUE(reopened.load().is_ok());
        ASSERT_EQ(reopened.size(), 2u);
        EXPECT_EQ(reopened.get("100")->status, ItemStatus::Completed);
        EXPECT_EQ(reopened.get("200")->status, ItemStatus::Pending);
    }
    std::filesystem::remove_all(root);
}
