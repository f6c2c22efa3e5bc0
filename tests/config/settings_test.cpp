#include "outbox/config/contacts.hpp"
#include "outbox/config/settings.hpp"
#include "outbox/storage/kv_store.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace outbox;
using namespace outbox::config;

class SettingsTest : public ::testing::Test {
protected:
    storage::MemoryKeyValueStore kv_;
};

TEST_F(SettingsTest, FreshStoreHasNoEndpoint) {
    KeyValueSettingsProvider settings(kv_);
    ASSERT_TRUE(settings.load().is_ok());
    EXPECT_FALSE(settings.endpoint_config().has_value());
    EXPECT_EQ(settings.settings().message_check_frequency_ms, 900000);
}

TEST_F(SettingsTest, UpdatePersistsAndReloads) {
    {
        KeyValueSettingsProvider settings(kv_);
        ASSERT_TRUE(settings.load().is_ok());
        SettingsUpdate update;
        update.user_api_key = "abc123";
        update.api_endpoint = "http://media.local:8080///";
        ASSERT_TRUE(settings.update(update).is_ok());
    }

    KeyValueSettingsProvider reloaded(kv_);
    ASSERT_TRUE(reloaded.load().is_ok());
    auto endpoint = reloaded.endpoint_config();
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->user_key, "abc123");
    EXPECT_EQ(endpoint->base_url, "http://media.local:8080");

    auto blob = kv_.get(KeyValueSettingsProvider::kStorageKey);
    ASSERT_TRUE(blob.is_ok());
    ASSERT_TRUE(blob.value().has_value());
    auto json = nlohmann::json::parse(*blob.value());
    EXPECT_EQ(json["userApiKey"], "abc123");
    EXPECT_EQ(json["apiEndpoint"], "http://media.local:8080");
    EXPECT_EQ(json["messageCheckFrequency"], 900000);
}

TEST_F(SettingsTest, BlankValuesAreRejected) {
    KeyValueSettingsProvider settings(kv_);
    ASSERT_TRUE(settings.load().is_ok());

    SettingsUpdate blank_key;
    blank_key.user_api_key = "   ";
    blank_key.api_endpoint = "http://media.local";
    auto result = settings.update(blank_key);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);

    // Endpoint alone is not enough while the key is still unset
    SettingsUpdate endpoint_only;
    endpoint_only.api_endpoint = "http://media.local";
    EXPECT_TRUE(settings.update(endpoint_only).is_error());

    EXPECT_FALSE(settings.endpoint_config().has_value());
    EXPECT_EQ(kv_.write_count(), 0u);
}

TEST_F(SettingsTest, CheckFrequencyHasLowerBound) {
    KeyValueSettingsProvider settings(kv_);
    ASSERT_TRUE(settings.load().is_ok());

    SettingsUpdate update;
    update.user_api_key = "k";
    update.api_endpoint = "http://media.local";
    update.message_check_frequency_ms = 29999;
    EXPECT_TRUE(settings.update(update).is_error());

    update.message_check_frequency_ms = 30000;
    ASSERT_TRUE(settings.update(update).is_ok());
    EXPECT_EQ(settings.settings().message_check_frequency_ms, 30000);
}

TEST_F(SettingsTest, PartialUpdateKeepsOtherFields) {
    KeyValueSettingsProvider settings(kv_);
    ASSERT_TRUE(settings.load().is_ok());

    SettingsUpdate first;
    first.user_api_key = "k1";
    first.api_endpoint = "http://a.local";
    ASSERT_TRUE(settings.update(first).is_ok());

    SettingsUpdate second;
    second.user_api_key = "k2";
    ASSERT_TRUE(settings.update(second).is_ok());

    auto endpoint = settings.endpoint_config();
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint->user_key, "k2");
    EXPECT_EQ(endpoint->base_url, "http://a.local");
}

TEST_F(SettingsTest, FailedWriteLeavesSettingsUntouched) {
    KeyValueSettingsProvider settings(kv_);
    ASSERT_TRUE(settings.load().is_ok());

    kv_.set_fail_writes(true);
    SettingsUpdate update;
    update.user_api_key = "k";
    update.api_endpoint = "http://media.local";
    auto result = settings.update(update);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Storage);
    EXPECT_FALSE(settings.endpoint_config().has_value());
}

TEST_F(SettingsTest, CorruptBlobFallsBackToDefaults) {
    ASSERT_TRUE(kv_.set(KeyValueSettingsProvider::kStorageKey, "{not json").is_ok());

    KeyValueSettingsProvider settings(kv_);
    auto result = settings.load();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
    EXPECT_FALSE(settings.endpoint_config().has_value());
}

TEST(ContactsTest, ResolvesDisplayNames) {
    storage::MemoryKeyValueStore kv;
    ASSERT_TRUE(kv.set(KeyValueContactsDirectory::kStorageKey,
                       R"([{"id": "u1", "display_name": "Ana"},
                           {"id": "u2", "display_name": ""},
                           {"display_name": "nobody"},
                           42])")
                    .is_ok());

    KeyValueContactsDirectory contacts(kv);
    ASSERT_TRUE(contacts.load().is_ok());
    EXPECT_EQ(contacts.size(), 2u);
    EXPECT_EQ(contacts.display_name("u1").value_or(""), "Ana");
    EXPECT_FALSE(contacts.display_name("u2").has_value());
    EXPECT_FALSE(contacts.display_name("u3").has_value());
}

TEST(ContactsTest, MissingBlobIsEmpty) {
    storage::MemoryKeyValueStore kv;
    KeyValueContactsDirectory contacts(kv);
    ASSERT_TRUE(contacts.load().is_ok());
    EXPECT_EQ(contacts.size(), 0u);
}

TEST(ContactsTest, NonArrayBlobIsParseError) {
    storage::MemoryKeyValueStore kv;
    ASSERT_TRUE(kv.set(KeyValueContactsDirectory::kStorageKey, R"({"id": "u1"})").is_ok());

    KeyValueContactsDirectory contacts(kv);
    auto result = contacts.load();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Parse);
}
