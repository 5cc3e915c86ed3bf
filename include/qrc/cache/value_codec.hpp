#pragma once

/// @file value_codec.hpp
/// @brief Conversions between typed values and the cache's opaque payload.
///
/// Both tiers store payloads as text and never look inside them. The
/// coordinator's typed helpers (getAs / putAs / readThroughAs) go through a
/// ValueCodec<T> specialization. Specialize ValueCodec for your own types
/// to cache them:
///
/// @code
///   template <>
///   struct qrc::cache::ValueCodec<PriceQuote> {
///       static CacheResult<std::string> encode(const PriceQuote& q);
///       static CacheResult<PriceQuote> decode(std::string_view payload);
///   };
/// @endcode

#include <cstdint>
#include <string>
#include <string_view>

#include "qrc/foundation/cache_result.hpp"
#include "qrc/foundation/database.hpp"

namespace qrc::cache {

template <typename T>
struct ValueCodec;

/// Identity: the payload is the string itself.
template <>
struct ValueCodec<std::string> {
    static qrc::foundation::CacheResult<std::string> encode(const std::string& value) {
        return qrc::foundation::CacheResult<std::string>::ok(value);
    }

    static qrc::foundation::CacheResult<std::string> decode(std::string_view payload) {
        return qrc::foundation::CacheResult<std::string>::ok(std::string(payload));
    }
};

/// JSON integer.
template <>
struct ValueCodec<std::int64_t> {
    static qrc::foundation::CacheResult<std::string> encode(std::int64_t value);
    static qrc::foundation::CacheResult<std::int64_t> decode(std::string_view payload);
};

/// JSON number; NaN and infinity cannot be encoded.
template <>
struct ValueCodec<double> {
    static qrc::foundation::CacheResult<std::string> encode(double value);
    static qrc::foundation::CacheResult<double> decode(std::string_view payload);
};

/// JSON true / false.
template <>
struct ValueCodec<bool> {
    static qrc::foundation::CacheResult<std::string> encode(bool value);
    static qrc::foundation::CacheResult<bool> decode(std::string_view payload);
};

/// Row set as a JSON array of objects, columns in byte order.
template <>
struct ValueCodec<qrc::foundation::QueryResult> {
    static qrc::foundation::CacheResult<std::string> encode(
        const qrc::foundation::QueryResult& rows);
    static qrc::foundation::CacheResult<qrc::foundation::QueryResult> decode(
        std::string_view payload);
};

} // namespace qrc::cache
