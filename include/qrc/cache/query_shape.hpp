#pragma once

/// @file query_shape.hpp
/// @brief Structured description of a cached query or computation.

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "qrc/foundation/database.hpp"

namespace qrc::cache {

/// A list of scalar parameters (e.g. the ids of an IN clause).
using ShapeList = std::vector<qrc::foundation::DbValue>;

/// Value of one shape field: a database scalar or a list of them.
using ShapeValue = std::variant<qrc::foundation::DbNull, std::string,
                                std::int64_t, double, bool, ShapeList>;

/// Named parameter set identifying a cached result.
///
/// Fields are kept sorted by name, so two shapes built with the same fields
/// in a different order are equal and derive the same key.
///
/// Example:
/// @code
///   QueryShape shape;
///   shape.setString("sku", "A1").setInt("warehouse", 7);
///   auto key = KeyDeriver::deriveKey("prices", shape);
/// @endcode
class QueryShape {
public:
    QueryShape() = default;

    /// Set (or replace) a field.
    QueryShape& set(std::string_view field, ShapeValue value);

    QueryShape& setString(std::string_view field, std::string value);

    QueryShape& setInt(std::string_view field, std::int64_t value);

    QueryShape& setDouble(std::string_view field, double value);

    QueryShape& setBool(std::string_view field, bool value);

    QueryShape& setNull(std::string_view field);

    QueryShape& setList(std::string_view field, ShapeList values);

    [[nodiscard]] const std::map<std::string, ShapeValue, std::less<>>& fields() const noexcept {
        return fields_;
    }

    [[nodiscard]] bool empty() const noexcept { return fields_.empty(); }

    bool operator==(const QueryShape& other) const { return fields_ == other.fields_; }

private:
    std::map<std::string, ShapeValue, std::less<>> fields_;
};

} // namespace qrc::cache
