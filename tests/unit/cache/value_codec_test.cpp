#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>

#include "qrc/cache/canonical_json.hpp"
#include "qrc/cache/value_codec.hpp"

using namespace qrc::cache;
using qrc::foundation::DbNull;
using qrc::foundation::DbRow;
using qrc::foundation::DbValue;
using qrc::foundation::ErrorCode;
using qrc::foundation::QueryResult;

// ===========================================================================
// Scalars
// ===========================================================================

TEST(ValueCodecTest, StringIsIdentity) {
    auto encoded = ValueCodec<std::string>::encode("{not json}");
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), "{not json}");
    EXPECT_EQ(ValueCodec<std::string>::decode("raw").value(), "raw");
}

TEST(ValueCodecTest, IntegerText) {
    EXPECT_EQ(ValueCodec<std::int64_t>::encode(42).value(), "42");
    EXPECT_EQ(ValueCodec<std::int64_t>::encode(-7).value(), "-7");

    auto decoded = ValueCodec<std::int64_t>::decode(" 42 ");
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value(), 42);
}

TEST(ValueCodecTest, IntegerRejectsOtherPayloads) {
    for (const char* payload : {"4.5", "\"42\"", "true", "42 43", ""}) {
        auto decoded = ValueCodec<std::int64_t>::decode(payload);
        ASSERT_TRUE(decoded.hasError()) << payload;
        EXPECT_EQ(decoded.error().code(), ErrorCode::ValueDecodeFailed);
    }
}

TEST(ValueCodecTest, DoubleText) {
    EXPECT_EQ(ValueCodec<double>::encode(2.0).value(), "2.0");
    EXPECT_EQ(ValueCodec<double>::encode(0.25).value(), "0.25");
    EXPECT_DOUBLE_EQ(ValueCodec<double>::decode("0.25").value(), 0.25);
}

TEST(ValueCodecTest, DoubleAcceptsWholeNumbers) {
    auto decoded = ValueCodec<double>::decode("3");
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_DOUBLE_EQ(decoded.value(), 3.0);
}

TEST(ValueCodecTest, NonFiniteDoubleCannotBeEncoded) {
    auto encoded = ValueCodec<double>::encode(std::numeric_limits<double>::infinity());
    ASSERT_TRUE(encoded.hasError());
    EXPECT_EQ(encoded.error().code(), ErrorCode::InvalidArgument);
}

TEST(ValueCodecTest, BoolText) {
    EXPECT_EQ(ValueCodec<bool>::encode(true).value(), "true");
    EXPECT_FALSE(ValueCodec<bool>::decode("false").value());
    EXPECT_EQ(ValueCodec<bool>::decode("1").error().code(), ErrorCode::ValueDecodeFailed);
}

// ===========================================================================
// Row sets
// ===========================================================================

TEST(QueryResultCodecTest, ColumnsWrittenInSortedOrder) {
    QueryResult rows;
    rows.push_back(DbRow{{"symbol", DbValue(std::string("A1"))},
                         {"bid", DbValue(41.5)},
                         {"ask", DbValue(std::int64_t{42})},
                         {"note", DbValue(DbNull{})}});

    auto encoded = ValueCodec<QueryResult>::encode(rows);
    ASSERT_TRUE(encoded.hasValue());
    EXPECT_EQ(encoded.value(), R"([{"ask":42,"bid":41.5,"note":null,"symbol":"A1"}])");
}

TEST(QueryResultCodecTest, EmptyRowSet) {
    EXPECT_EQ(ValueCodec<QueryResult>::encode({}).value(), "[]");
    auto decoded = ValueCodec<QueryResult>::decode("[]");
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_TRUE(decoded.value().empty());
}

TEST(QueryResultCodecTest, DecodeRestoresRows) {
    QueryResult rows;
    rows.push_back(DbRow{{"id", DbValue(std::int64_t{1})}, {"active", DbValue(true)}});
    rows.push_back(DbRow{{"id", DbValue(std::int64_t{2})}, {"name", DbValue(std::string("b\"q"))}});
    rows.push_back(DbRow{});

    auto decoded = ValueCodec<QueryResult>::decode(ValueCodec<QueryResult>::encode(rows).value());
    ASSERT_TRUE(decoded.hasValue());
    EXPECT_EQ(decoded.value(), rows);
}

TEST(QueryResultCodecTest, DecodeToleratesWhitespaceAndUnicodeEscapes) {
    auto decoded = ValueCodec<QueryResult>::decode(
        " [ { \"city\" : \"caf\\u00e9\" , \"smile\" : \"\\ud83d\\ude00\" } ] ");
    ASSERT_TRUE(decoded.hasValue());
    ASSERT_EQ(decoded.value().size(), 1u);
    const auto& row = decoded.value()[0];
    EXPECT_EQ(std::get<std::string>(row.at("city")), "caf\xC3\xA9");
    EXPECT_EQ(std::get<std::string>(row.at("smile")), "\xF0\x9F\x98\x80");
}

TEST(QueryResultCodecTest, MalformedPayloadsFail) {
    for (const char* payload : {"", "{}", "[", "[{]", "[{\"a\":}]", "[{\"a\":1},]",
                                "[{\"a\":[1]}]", "[] trailing", "[{\"a\":\"\\ud800\"}]"}) {
        auto decoded = ValueCodec<QueryResult>::decode(payload);
        ASSERT_TRUE(decoded.hasError()) << payload;
        EXPECT_EQ(decoded.error().code(), ErrorCode::ValueDecodeFailed);
    }
}

TEST(QueryResultCodecTest, NonFiniteColumnCannotBeEncoded) {
    QueryResult rows;
    rows.push_back(DbRow{{"x", DbValue(std::numeric_limits<double>::quiet_NaN())}});
    auto encoded = ValueCodec<QueryResult>::encode(rows);
    ASSERT_TRUE(encoded.hasError());
    EXPECT_EQ(encoded.error().code(), ErrorCode::InvalidArgument);
}

// ===========================================================================
// Reader primitives
// ===========================================================================

TEST(JsonReaderTest, ReadsScalarsInSequence) {
    json::Reader reader(R"([null, true, -12, 1.5e3, "s"])");
    DbValue v;
    ASSERT_TRUE(reader.consume('['));
    ASSERT_TRUE(reader.readScalar(v));
    EXPECT_TRUE(std::holds_alternative<DbNull>(v));
    ASSERT_TRUE(reader.consume(','));
    ASSERT_TRUE(reader.readScalar(v));
    EXPECT_EQ(std::get<bool>(v), true);
    ASSERT_TRUE(reader.consume(','));
    ASSERT_TRUE(reader.readScalar(v));
    EXPECT_EQ(std::get<std::int64_t>(v), -12);
    ASSERT_TRUE(reader.consume(','));
    ASSERT_TRUE(reader.readScalar(v));
    EXPECT_DOUBLE_EQ(std::get<double>(v), 1500.0);
    ASSERT_TRUE(reader.consume(','));
    ASSERT_TRUE(reader.readScalar(v));
    EXPECT_EQ(std::get<std::string>(v), "s");
    ASSERT_TRUE(reader.consume(']'));
    EXPECT_TRUE(reader.atEnd());
}

TEST(JsonUtf8Test, Validation) {
    EXPECT_TRUE(json::isValidUtf8("plain"));
    EXPECT_TRUE(json::isValidUtf8("\xE2\x82\xAC"));          // euro sign
    EXPECT_FALSE(json::isValidUtf8("\xE2\x82"));             // truncated
    EXPECT_FALSE(json::isValidUtf8("\xED\xA0\x80"));         // surrogate
    EXPECT_FALSE(json::isValidUtf8("\xF4\x90\x80\x80"));     // above U+10FFFF
}
