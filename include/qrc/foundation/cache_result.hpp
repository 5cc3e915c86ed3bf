#pragma once

/// @file cache_result.hpp
/// @brief CacheResult<T> alias used by every fallible operation in qrc.

#include "qrc/core/result.hpp"
#include "qrc/foundation/cache_error.hpp"

namespace qrc::foundation {

/// Result type specialized with CacheError.
///
/// Example:
/// @code
///   CacheResult<std::chrono::milliseconds> checkTtl(std::chrono::milliseconds ttl) {
///       if (ttl.count() <= 0) {
///           return CacheResult<std::chrono::milliseconds>::err(
///               CacheError(ErrorCode::InvalidTtl, "ttl must be positive"));
///       }
///       return CacheResult<std::chrono::milliseconds>::ok(ttl);
///   }
/// @endcode
template <typename T>
using CacheResult = qrc::Result<T, CacheError>;

}  // namespace qrc::foundation
