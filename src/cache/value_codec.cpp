/// @file value_codec.cpp
/// @brief Built-in ValueCodec specializations.

#include "qrc/cache/value_codec.hpp"

#include <algorithm>
#include <vector>

#include "qrc/cache/canonical_json.hpp"

namespace qrc::cache {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::DbRow;
using qrc::foundation::DbValue;
using qrc::foundation::ErrorCode;
using qrc::foundation::QueryResult;

namespace {

template <typename T>
CacheResult<T> decodeFailed(std::string_view what, std::string_view payload) {
    constexpr std::size_t kPreview = 32;
    std::string message = "cannot decode ";
    message += what;
    message += " from payload '";
    message += payload.substr(0, kPreview);
    if (payload.size() > kPreview) {
        message += "...";
    }
    message += '\'';
    return CacheResult<T>::err(CacheError(ErrorCode::ValueDecodeFailed, std::move(message)));
}

CacheResult<std::string> encodeScalar(const DbValue& value) {
    std::string out;
    auto appended = json::appendScalar(out, value);
    if (appended.hasError()) {
        return CacheResult<std::string>::err(appended.error());
    }
    return CacheResult<std::string>::ok(std::move(out));
}

/// Read exactly one scalar of alternative T from @p payload.
template <typename T>
bool decodeScalar(std::string_view payload, T& out) {
    json::Reader reader(payload);
    DbValue value;
    if (!reader.readScalar(value) || !reader.atEnd()) {
        return false;
    }
    if (const auto* v = std::get_if<T>(&value)) {
        out = *v;
        return true;
    }
    return false;
}

} // namespace

// ── Scalars ─────────────────────────────────────────────────────────────────

CacheResult<std::string> ValueCodec<std::int64_t>::encode(std::int64_t value) {
    return encodeScalar(DbValue(value));
}

CacheResult<std::int64_t> ValueCodec<std::int64_t>::decode(std::string_view payload) {
    std::int64_t value = 0;
    if (!decodeScalar(payload, value)) {
        return decodeFailed<std::int64_t>("integer", payload);
    }
    return CacheResult<std::int64_t>::ok(value);
}

CacheResult<std::string> ValueCodec<double>::encode(double value) {
    return encodeScalar(DbValue(value));
}

CacheResult<double> ValueCodec<double>::decode(std::string_view payload) {
    json::Reader reader(payload);
    DbValue value;
    if (!reader.readScalar(value) || !reader.atEnd()) {
        return decodeFailed<double>("number", payload);
    }
    // Whole numbers written by other producers arrive as integers.
    if (const auto* d = std::get_if<double>(&value)) {
        return CacheResult<double>::ok(*d);
    }
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return CacheResult<double>::ok(static_cast<double>(*i));
    }
    return decodeFailed<double>("number", payload);
}

CacheResult<std::string> ValueCodec<bool>::encode(bool value) {
    return encodeScalar(DbValue(value));
}

CacheResult<bool> ValueCodec<bool>::decode(std::string_view payload) {
    bool value = false;
    if (!decodeScalar(payload, value)) {
        return decodeFailed<bool>("boolean", payload);
    }
    return CacheResult<bool>::ok(value);
}

// ── QueryResult ─────────────────────────────────────────────────────────────

CacheResult<std::string> ValueCodec<QueryResult>::encode(const QueryResult& rows) {
    std::string out;
    out += '[';
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) {
            out += ',';
        }

        std::vector<const DbRow::value_type*> columns;
        columns.reserve(rows[r].size());
        for (const auto& column : rows[r]) {
            columns.push_back(&column);
        }
        std::sort(columns.begin(), columns.end(),
                  [](const auto* a, const auto* b) { return a->first < b->first; });

        out += '{';
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                out += ',';
            }
            json::appendString(out, columns[c]->first);
            out += ':';
            auto appended = json::appendScalar(out, columns[c]->second);
            if (appended.hasError()) {
                return CacheResult<std::string>::err(
                    CacheError(ErrorCode::InvalidArgument,
                               "column '" + columns[c]->first +
                                   "' holds a non-finite number"));
            }
        }
        out += '}';
    }
    out += ']';
    return CacheResult<std::string>::ok(std::move(out));
}

CacheResult<QueryResult> ValueCodec<QueryResult>::decode(std::string_view payload) {
    json::Reader reader(payload);
    QueryResult rows;

    if (!reader.consume('[')) {
        return decodeFailed<QueryResult>("row set", payload);
    }
    bool expectRow = reader.peek() != ']';
    while (expectRow) {
        if (!reader.consume('{')) {
            return decodeFailed<QueryResult>("row set", payload);
        }
        DbRow row;
        bool expectColumn = reader.peek() != '}';
        while (expectColumn) {
            std::string column;
            DbValue value;
            if (!reader.readString(column) || !reader.consume(':') ||
                !reader.readScalar(value)) {
                return decodeFailed<QueryResult>("row set", payload);
            }
            row[std::move(column)] = std::move(value);
            expectColumn = reader.consume(',');
        }
        if (!reader.consume('}')) {
            return decodeFailed<QueryResult>("row set", payload);
        }
        rows.push_back(std::move(row));
        expectRow = reader.consume(',');
    }
    if (!reader.consume(']') || !reader.atEnd()) {
        return decodeFailed<QueryResult>("row set", payload);
    }
    return CacheResult<QueryResult>::ok(std::move(rows));
}

} // namespace qrc::cache
