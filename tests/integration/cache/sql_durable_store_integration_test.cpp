/// @file sql_durable_store_integration_test.cpp
/// @brief Integration tests for SqlDurableStore against a live database.
///
/// Tests skip gracefully if the QRC_TEST_DB_CONN environment variable is
/// not set. QRC_TEST_DB_TYPE selects the dialect (postgresql, mysql or
/// sqlite; default postgresql).
///
///   export QRC_TEST_DB_CONN="host=localhost dbname=qrc_test user=test password=test"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "qrc/cache/cache_coordinator.hpp"
#include "qrc/cache/key_deriver.hpp"
#include "qrc/cache/query_shape.hpp"
#include "qrc/cache/sql_durable_store.hpp"
#include "support/manual_clock.hpp"

using namespace qrc::cache;
using namespace qrc::foundation;
using namespace std::chrono_literals;

namespace {

std::string getEnv(const char* name) {
    const char* env = std::getenv(name);
    return env ? std::string(env) : std::string();
}

DatabaseType testDbType() {
    auto type = getEnv("QRC_TEST_DB_TYPE");
    if (type == "mysql") {
        return DatabaseType::MySQL;
    }
    if (type == "sqlite") {
        return DatabaseType::SQLite;
    }
    return DatabaseType::PostgreSQL;
}

} // anonymous namespace

// ===========================================================================
// Fixture
// ===========================================================================

class SqlDurableStoreIntegrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        connStr_ = getEnv("QRC_TEST_DB_CONN");
        if (connStr_.empty()) {
            GTEST_SKIP() << "QRC_TEST_DB_CONN not set; skipping live DB test";
        }
        clock_ = std::make_shared<qrc::test::ManualClock>();
    }

    void TearDown() override {
        if (store_) {
            (void)store_->removeAll();
            store_->stop();
        }
    }

    DurableConfig makeConfig() const {
        DurableConfig config;
        config.table = "qrc_integration_cache";
        config.reapInterval = 0s;
        config.database.connectionString = connStr_;
        config.database.dbType = testDbType();
        config.database.maxConnections = 2;
        return config;
    }

    void openStore() {
        auto opened = SqlDurableStore::open(makeConfig(), clock_);
        ASSERT_TRUE(opened.hasValue())
            << "open failed: " << opened.error().message();
        store_ = opened.value();
        ASSERT_TRUE(store_->removeAll().hasValue());
    }

    std::string connStr_;
    std::shared_ptr<qrc::test::ManualClock> clock_;
    std::shared_ptr<SqlDurableStore> store_;
};

// ===========================================================================
// Store round trip
// ===========================================================================

TEST_F(SqlDurableStoreIntegrationTest, PutGetAndOverwrite) {
    ASSERT_NO_FATAL_FAILURE(openStore());

    ASSERT_TRUE(store_->put("prices:aa", "[1,2]", "prices", 60s).hasValue());
    auto got = store_->get("prices:aa");
    ASSERT_TRUE(got.hasValue());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(got.value()->value, "[1,2]");
    EXPECT_EQ(got.value()->ns, "prices");

    ASSERT_TRUE(store_->put("prices:aa", "it's \"quoted\"", "prices", 60s).hasValue());
    got = store_->get("prices:aa");
    ASSERT_TRUE(got.hasValue());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(got.value()->value, "it's \"quoted\"");
}

TEST_F(SqlDurableStoreIntegrationTest, ExpiredRowIsAbsentAndDeleted) {
    ASSERT_NO_FATAL_FAILURE(openStore());

    ASSERT_TRUE(store_->put("prices:bb", "1", "prices", 1s).hasValue());
    clock_->advance(2s);

    auto got = store_->get("prices:bb");
    ASSERT_TRUE(got.hasValue());
    EXPECT_FALSE(got.value().has_value());

    auto stats = store_->stats();
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(stats.value().totalEntries, 0u);
}

TEST_F(SqlDurableStoreIntegrationTest, NamespaceRemovalAndStats) {
    ASSERT_NO_FATAL_FAILURE(openStore());

    ASSERT_TRUE(store_->put("prices:1", "a", "prices", 60s).hasValue());
    ASSERT_TRUE(store_->put("prices:2", "b", "prices", 60s).hasValue());
    ASSERT_TRUE(store_->put("analysis:1", "c", "analysis", 60s).hasValue());

    auto stats = store_->stats();
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(stats.value().totalEntries, 3u);
    EXPECT_EQ(stats.value().entriesByNamespace.at("prices"), 2u);
    EXPECT_TRUE(stats.value().oldestEntry.has_value());

    ASSERT_TRUE(store_->removeByNamespace("prices").hasValue());
    stats = store_->stats();
    ASSERT_TRUE(stats.hasValue());
    EXPECT_EQ(stats.value().totalEntries, 1u);
    EXPECT_EQ(stats.value().entriesByNamespace.count("prices"), 0u);
}

TEST_F(SqlDurableStoreIntegrationTest, ReapRemovesOnlyExpiredRows) {
    ASSERT_NO_FATAL_FAILURE(openStore());

    ASSERT_TRUE(store_->put("prices:short", "a", "prices", 1s).hasValue());
    ASSERT_TRUE(store_->put("prices:long", "b", "prices", 1h).hasValue());
    clock_->advance(5s);

    auto reaped = store_->reapExpired();
    ASSERT_TRUE(reaped.hasValue());
    EXPECT_EQ(reaped.value(), 1u);

    auto got = store_->get("prices:long");
    ASSERT_TRUE(got.hasValue());
    EXPECT_TRUE(got.value().has_value());
}

// ===========================================================================
// Coordinator over the SQL tier
// ===========================================================================

TEST_F(SqlDurableStoreIntegrationTest, EntrySurvivesFastTierRestart) {
    ASSERT_NO_FATAL_FAILURE(openStore());

    CacheConfig config;
    config.sweepInterval = 0s;
    config.durable = makeConfig();

    QueryShape shape;
    shape.setString("symbol", "ACME").setInt("days", 30);

    {
        CacheCoordinator first(config, nullptr, store_, clock_);
        ASSERT_TRUE(first.put("prices", shape, "[101.5]", 10min).hasValue());
    }

    // A new coordinator starts with an empty fast tier.
    CacheCoordinator second(config, nullptr, store_, clock_);
    auto got = second.get("prices", shape);
    ASSERT_TRUE(got.hasValue());
    ASSERT_TRUE(got.value().has_value());
    EXPECT_EQ(*got.value(), "[101.5]");
    EXPECT_EQ(second.stats().durableHits, 1u);

    got = second.get("prices", shape);
    ASSERT_TRUE(got.hasValue());
    EXPECT_EQ(second.stats().fastHits, 1u);

    ASSERT_TRUE(second.invalidate("prices").hasValue());
    auto key = KeyDeriver::deriveKey("prices", shape);
    ASSERT_TRUE(key.hasValue());
    auto row = store_->get(key.value());
    ASSERT_TRUE(row.hasValue());
    EXPECT_FALSE(row.value().has_value());
}
