#pragma once

/// @file key_deriver.hpp
/// @brief Deterministic (namespace, shape) -> cache key derivation.

#include <string>
#include <string_view>

#include "qrc/cache/query_shape.hpp"
#include "qrc/foundation/cache_result.hpp"

namespace qrc::cache {

/// Maps a namespace and a QueryShape to a cache key.
///
/// key = namespace ':' lowercase-hex(SHA-256(canonical JSON of shape))
///
/// The canonical text is a JSON object with fields in byte order, so the
/// key is stable across field order, restarts and platforms. The namespace
/// is kept as a readable prefix which lets the fast tier invalidate a
/// namespace by exact prefix match without a secondary index.
class KeyDeriver {
public:
    static constexpr char kSeparator = ':';

    /// Length of the hex digest part of every key.
    static constexpr std::size_t kDigestHexLength = 64;

    /// Derive the key for @p shape under @p ns.
    /// @return InvalidNamespace or InvalidShape on bad input.
    [[nodiscard]] static qrc::foundation::CacheResult<std::string> deriveKey(
        std::string_view ns, const QueryShape& shape);

    /// Canonical JSON serialization of @p shape.
    /// @return InvalidShape for empty field names, non-finite doubles or
    ///         strings that are not valid UTF-8.
    [[nodiscard]] static qrc::foundation::CacheResult<std::string> canonicalize(
        const QueryShape& shape);

    /// A namespace must be non-empty and must not contain the separator.
    [[nodiscard]] static qrc::foundation::CacheResult<void> validateNamespace(
        std::string_view ns);

    /// Key prefix shared by every key derived under @p ns.
    [[nodiscard]] static std::string prefixFor(std::string_view ns);
};

} // namespace qrc::cache
