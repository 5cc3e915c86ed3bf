#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "qrc/cache/in_memory_durable_store.hpp"
#include "qrc/cache/sql_durable_store.hpp"
#include "qrc/foundation/cache_error.hpp"
#include "qrc/foundation/database.hpp"
#include "support/manual_clock.hpp"

using namespace qrc::cache;
using namespace std::chrono_literals;
using qrc::foundation::CacheError;
using qrc::foundation::Database;
using qrc::foundation::ErrorCode;
using qrc::test::ManualClock;

// ===========================================================================
// InMemoryDurableStore
// ===========================================================================

class InMemoryDurableStoreTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock_ = std::make_shared<ManualClock>();
    InMemoryDurableStore store_{clock_};
};

TEST_F(InMemoryDurableStoreTest, PutThenGet) {
    ASSERT_TRUE(store_.put("prices:a", "42", "prices", 5s).hasValue());

    auto entry = store_.get("prices:a");
    ASSERT_TRUE(entry.hasValue());
    ASSERT_TRUE(entry.value().has_value());
    EXPECT_EQ(entry.value()->key, "prices:a");
    EXPECT_EQ(entry.value()->ns, "prices");
    EXPECT_EQ(entry.value()->value, "42");
    EXPECT_EQ(entry.value()->expiresAt - entry.value()->createdAt, 5s);
}

TEST_F(InMemoryDurableStoreTest, MissingKeyIsAbsent) {
    auto entry = store_.get("prices:none");
    ASSERT_TRUE(entry.hasValue());
    EXPECT_FALSE(entry.value().has_value());
}

TEST_F(InMemoryDurableStoreTest, ExpiredEntryIsDeletedOnRead) {
    ASSERT_TRUE(store_.put("k:1", "v", "k", 1s).hasValue());
    clock_->advance(1s);

    auto entry = store_.get("k:1");
    ASSERT_TRUE(entry.hasValue());
    EXPECT_FALSE(entry.value().has_value());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(InMemoryDurableStoreTest, HugeTtlSaturatesExpiry) {
    ASSERT_TRUE(store_.put("k:forever", "v", "k", Ttl::max()).hasValue());

    auto entry = store_.get("k:forever");
    ASSERT_TRUE(entry.hasValue());
    ASSERT_TRUE(entry.value().has_value());
    EXPECT_EQ(entry.value()->expiresAt, TimePoint::max());

    clock_->advance(std::chrono::hours(24 * 365 * 100));
    auto reaped = store_.reapExpired();
    ASSERT_TRUE(reaped.hasValue());
    EXPECT_EQ(reaped.value(), 0u);
}

TEST_F(InMemoryDurableStoreTest, UpsertRefreshesTimestamps) {
    ASSERT_TRUE(store_.put("k:1", "v1", "k", 5s).hasValue());
    clock_->advance(3s);
    ASSERT_TRUE(store_.put("k:1", "v2", "k", 5s).hasValue());

    auto entry = store_.get("k:1").value();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->value, "v2");
    EXPECT_EQ(entry->createdAt, clock_->now());
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemoryDurableStoreTest, RemoveByKeyAndNamespace) {
    ASSERT_TRUE(store_.put("prices:a", "1", "prices", 5s).hasValue());
    ASSERT_TRUE(store_.put("prices:b", "2", "prices", 5s).hasValue());
    ASSERT_TRUE(store_.put("quotes:a", "3", "quotes", 5s).hasValue());

    ASSERT_TRUE(store_.removeByKey("prices:a").hasValue());
    EXPECT_FALSE(store_.get("prices:a").value().has_value());

    ASSERT_TRUE(store_.removeByNamespace("prices").hasValue());
    EXPECT_FALSE(store_.get("prices:b").value().has_value());
    EXPECT_TRUE(store_.get("quotes:a").value().has_value());

    ASSERT_TRUE(store_.removeAll().hasValue());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(InMemoryDurableStoreTest, ReapExpiredCountsRemovedEntries) {
    ASSERT_TRUE(store_.put("k:1", "v", "k", 1s).hasValue());
    ASSERT_TRUE(store_.put("k:2", "v", "k", 1s).hasValue());
    ASSERT_TRUE(store_.put("k:3", "v", "k", 1h).hasValue());
    clock_->advance(2s);

    auto reaped = store_.reapExpired();
    ASSERT_TRUE(reaped.hasValue());
    EXPECT_EQ(reaped.value(), 2u);
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemoryDurableStoreTest, StatsGroupByNamespace) {
    auto first = clock_->now();
    ASSERT_TRUE(store_.put("prices:a", "1", "prices", 1h).hasValue());
    clock_->advance(10s);
    ASSERT_TRUE(store_.put("prices:b", "2", "prices", 1h).hasValue());
    clock_->advance(10s);
    ASSERT_TRUE(store_.put("report:x", "3", "report", 1h).hasValue());

    auto stats = store_.stats();
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(stats.value().totalEntries, 3u);
    EXPECT_EQ(stats.value().entriesByNamespace.at("prices"), 2u);
    EXPECT_EQ(stats.value().entriesByNamespace.at("report"), 1u);
    ASSERT_TRUE(stats.value().oldestEntry.has_value());
    EXPECT_EQ(*stats.value().oldestEntry, first);
    EXPECT_EQ(*stats.value().newestEntry, clock_->now());
}

TEST_F(InMemoryDurableStoreTest, EmptyStats) {
    auto stats = store_.stats();
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(stats.value().totalEntries, 0u);
    EXPECT_FALSE(stats.value().oldestEntry.has_value());
    EXPECT_FALSE(stats.value().newestEntry.has_value());
}

// ===========================================================================
// SqlDurableStore: table names
// ===========================================================================

TEST(SqlDurableStoreTest, TableNameValidation) {
    EXPECT_TRUE(SqlDurableStore::isValidTableName("query_cache"));
    EXPECT_TRUE(SqlDurableStore::isValidTableName("_cache2"));
    EXPECT_FALSE(SqlDurableStore::isValidTableName(""));
    EXPECT_FALSE(SqlDurableStore::isValidTableName("2cache"));
    EXPECT_FALSE(SqlDurableStore::isValidTableName("cache; DROP TABLE users"));
    EXPECT_FALSE(SqlDurableStore::isValidTableName("schema.cache"));
    EXPECT_FALSE(SqlDurableStore::isValidTableName(std::string(64, 'a')));
}

TEST(SqlDurableStoreTest, InvalidTableNameRejectedAtInitialize) {
    DurableConfig config;
    config.table = "bad-name";
    SqlDurableStore store(std::make_shared<Database>(), config);

    auto init = store.initialize();
    ASSERT_TRUE(init.hasError());
    EXPECT_EQ(init.error().code(), ErrorCode::InvalidArgument);
    EXPECT_FALSE(store.isInitialized());
}

// ===========================================================================
// SqlDurableStore: degradation without a database
// ===========================================================================

TEST(SqlDurableStoreTest, InitializeWithoutConnectionIsUnavailable) {
    SqlDurableStore store(std::make_shared<Database>(), DurableConfig{});

    auto init = store.initialize();
    ASSERT_TRUE(init.hasError());
    EXPECT_EQ(init.error().code(), ErrorCode::PersistenceUnavailable);

    const auto* cause = init.error().context<CacheError>();
    ASSERT_NE(cause, nullptr);
    EXPECT_EQ(cause->code(), ErrorCode::NotConnected);
    EXPECT_FALSE(store.isInitialized());
}

TEST(SqlDurableStoreTest, OperationsBeforeInitializeAreUnavailable) {
    SqlDurableStore store(std::make_shared<Database>(), DurableConfig{});

    EXPECT_EQ(store.get("k:1").error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.put("k:1", "v", "k", 1s).error().code(),
              ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.removeByKey("k:1").error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.removeByNamespace("k").error().code(),
              ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.removeAll().error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.reapExpired().error().code(), ErrorCode::PersistenceUnavailable);
    EXPECT_EQ(store.stats().error().code(), ErrorCode::PersistenceUnavailable);
}

TEST(SqlDurableStoreTest, NullDatabaseIsUnavailable) {
    SqlDurableStore store(nullptr, DurableConfig{});
    auto init = store.initialize();
    ASSERT_TRUE(init.hasError());
    EXPECT_EQ(init.error().code(), ErrorCode::PersistenceUnavailable);
}
