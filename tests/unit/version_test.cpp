#include <gtest/gtest.h>

#include "qrc/qrc.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(qrc::Version::major, 0);
    EXPECT_EQ(qrc::Version::minor, 3);
    EXPECT_EQ(qrc::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(qrc::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = qrc::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorWithCode) {
    auto result = qrc::Result<int>::err(qrc::Error(404, "not found"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
}

TEST(ResultTest, ErrorWithoutCodeDefaultsToMinusOne) {
    auto result = qrc::Result<int>::err(qrc::Error("something failed"));
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ValueOr) {
    auto ok = qrc::Result<int>::ok(10);
    auto err = qrc::Result<int>::err(qrc::Error("fail"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, BoolConversion) {
    EXPECT_TRUE(static_cast<bool>(qrc::Result<int>::ok(1)));
    EXPECT_FALSE(static_cast<bool>(qrc::Result<int>::err(qrc::Error("fail"))));
}

TEST(ResultVoidTest, OkAndError) {
    EXPECT_TRUE(qrc::Result<void>::ok().hasValue());
    auto result = qrc::Result<void>::err(qrc::Error("void error"));
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
