#pragma once

/// @file qrc.hpp
/// @brief Umbrella header for the qrc query result cache.

#include "qrc/version.hpp"
#include "qrc/core/result.hpp"

#include "qrc/foundation/cache_error.hpp"
#include "qrc/foundation/cache_logger.hpp"
#include "qrc/foundation/cache_result.hpp"
#include "qrc/foundation/config_manager.hpp"
#include "qrc/foundation/database.hpp"
#include "qrc/foundation/error_code.hpp"

#include "qrc/cache/cache_config.hpp"
#include "qrc/cache/cache_coordinator.hpp"
#include "qrc/cache/cache_types.hpp"
#include "qrc/cache/clock.hpp"
#include "qrc/cache/durable_store.hpp"
#include "qrc/cache/fast_store.hpp"
#include "qrc/cache/in_memory_durable_store.hpp"
#include "qrc/cache/key_deriver.hpp"
#include "qrc/cache/query_shape.hpp"
#include "qrc/cache/sql_durable_store.hpp"
#include "qrc/cache/value_codec.hpp"
