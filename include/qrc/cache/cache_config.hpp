#pragma once

/// @file cache_config.hpp
/// @brief Build a CacheConfig from YAML configuration.

#include <string_view>

#include "qrc/cache/cache_types.hpp"
#include "qrc/foundation/cache_result.hpp"
#include "qrc/foundation/config_manager.hpp"

namespace qrc::cache {

/// Read cache settings under @p prefix (default "cache").
///
/// Recognized keys (all optional, defaults from CacheConfig):
/// @code
///   cache:
///     default_ttl_seconds: 300
///     sweep_interval_seconds: 60
///     durable:
///       enabled: true
///       table: query_cache
///       reap_interval_seconds: 60
///     database:
///       connection_string: "host=localhost dbname=app"
///       type: postgresql        # postgresql | mysql | sqlite
///       min_connections: 1
///       max_connections: 8
///       connection_timeout_seconds: 10
/// @endcode
///
/// @return ConfigTypeMismatch if a key is present with the wrong type or an
///         unknown database type, InvalidTtl for a default TTL that is not
///         positive or exceeds kMaxTtl, InvalidArgument for intervals that are
///         negative or exceed kMaxScheduleInterval.
[[nodiscard]] qrc::foundation::CacheResult<CacheConfig> loadCacheConfig(
    const qrc::foundation::ConfigManager& config,
    std::string_view prefix = "cache");

} // namespace qrc::cache
