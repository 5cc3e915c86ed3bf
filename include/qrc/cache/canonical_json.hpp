#pragma once

/// @file canonical_json.hpp
/// @brief Canonical JSON text for database values.
///
/// One deterministic spelling per value so that equal inputs hash equally
/// on every run and every platform:
///   - integers in plain decimal;
///   - doubles in shortest round-trip form, always carrying a '.' or an
///     exponent so 2.0 never collides with the integer 2;
///   - strings escaped with \" \\ \b \f \n \r \t and \u00XX for other
///     control characters, everything else emitted verbatim;
///   - object keys sorted by byte order by the callers that write objects.

#include <cstddef>
#include <string>
#include <string_view>

#include "qrc/foundation/cache_result.hpp"
#include "qrc/foundation/database.hpp"

namespace qrc::cache::json {

/// Append @p value as a quoted, escaped JSON string.
void appendString(std::string& out, std::string_view value);

/// Append a scalar. Fails with InvalidArgument on NaN or infinity.
[[nodiscard]] qrc::foundation::CacheResult<void> appendScalar(
    std::string& out, const qrc::foundation::DbValue& value);

/// True when @p text is well-formed UTF-8 (no overlongs, no surrogates).
[[nodiscard]] bool isValidUtf8(std::string_view text);

/// Minimal pull reader for canonical JSON produced by this module.
///
/// Accepts any whitespace-separated standard JSON; only scalars, arrays and
/// objects of scalars are materialized.
class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    void skipWhitespace();

    /// Next non-whitespace character without consuming it ('\0' at end).
    [[nodiscard]] char peek();

    /// Consume @p c if it is next; false otherwise.
    bool consume(char c);

    /// Read a quoted string, decoding escapes (including surrogate pairs).
    bool readString(std::string& out);

    /// Read null, true, false, a number or a string.
    bool readScalar(qrc::foundation::DbValue& out);

    /// True once only whitespace remains.
    [[nodiscard]] bool atEnd();

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

private:
    bool readNumber(qrc::foundation::DbValue& out);
    bool readLiteral(std::string_view literal);
    bool readHex4(uint32_t& out);

    std::string_view text_;
    std::size_t pos_ = 0;
};

} // namespace qrc::cache::json
