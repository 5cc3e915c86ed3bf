#include <gtest/gtest.h>

#include <string>

#include "qrc/foundation/cache_error.hpp"
#include "qrc/foundation/cache_result.hpp"
#include "qrc/foundation/error_code.hpp"

using namespace qrc::foundation;

// --- ErrorCode tests ---

TEST(ErrorCodeTest, SubsystemLookup) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Success), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidArgument), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidShape), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidNamespace), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::InvalidTtl), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::ValueDecodeFailed), "Cache");
    EXPECT_EQ(errorSubsystem(ErrorCode::PersistenceUnavailable), "Persistence");
    EXPECT_EQ(errorSubsystem(ErrorCode::QueryFailed), "Database");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigKeyNotFound), "Config");
}

// --- CacheError tests ---

TEST(CacheErrorTest, DefaultConstruction) {
    CacheError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
}

TEST(CacheErrorTest, CodeAndMessage) {
    CacheError err(ErrorCode::InvalidTtl, "ttl must be positive");
    EXPECT_EQ(err.code(), ErrorCode::InvalidTtl);
    EXPECT_EQ(err.message(), "ttl must be positive");
    EXPECT_EQ(err.subsystem(), "Cache");
}

TEST(CacheErrorTest, WrapsUnderlyingError) {
    CacheError cause(ErrorCode::NotConnected, "not connected to database");
    CacheError err(ErrorCode::PersistenceUnavailable, "durable read failed", cause);

    ASSERT_TRUE(err.hasContext());
    const auto* inner = err.context<CacheError>();
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->code(), ErrorCode::NotConnected);

    // Wrong type returns nullptr
    EXPECT_EQ(err.context<int>(), nullptr);
}

// --- CacheResult tests ---

TEST(CacheResultTest, OkValue) {
    auto result = CacheResult<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_EQ(result.value(), 42);
}

TEST(CacheResultTest, ErrorValue) {
    auto result = CacheResult<int>::err(CacheError(ErrorCode::InvalidShape, "bad shape"));
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidShape);
    EXPECT_EQ(result.error().message(), "bad shape");
}

TEST(CacheResultTest, VoidOkAndError) {
    EXPECT_TRUE(CacheResult<void>::ok().hasValue());

    auto failed = CacheResult<void>::err(CacheError(ErrorCode::PersistenceUnavailable));
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::PersistenceUnavailable);
}

TEST(CacheResultTest, ValueTypeMayEqualErrorType) {
    using Same = qrc::Result<std::string, std::string>;
    auto ok = Same::ok("value");
    auto err = Same::err("error");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "error");
}

TEST(CacheResultTest, MoveOutValue) {
    auto result = CacheResult<std::string>::ok(std::string(100, 'x'));
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken.size(), 100u);
}
