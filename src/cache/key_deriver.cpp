/// @file key_deriver.cpp
/// @brief QueryShape and KeyDeriver implementation.

#include "qrc/cache/key_deriver.hpp"

#include <openssl/evp.h>

#include <array>
#include <type_traits>

#include "qrc/cache/canonical_json.hpp"

namespace qrc::cache {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::DbNull;
using qrc::foundation::DbValue;
using qrc::foundation::ErrorCode;

// ── QueryShape ──────────────────────────────────────────────────────────────

QueryShape& QueryShape::set(std::string_view field, ShapeValue value) {
    auto it = fields_.find(field);
    if (it != fields_.end()) {
        it->second = std::move(value);
    } else {
        fields_.emplace(std::string(field), std::move(value));
    }
    return *this;
}

QueryShape& QueryShape::setString(std::string_view field, std::string value) {
    return set(field, ShapeValue(std::move(value)));
}

QueryShape& QueryShape::setInt(std::string_view field, std::int64_t value) {
    return set(field, ShapeValue(value));
}

QueryShape& QueryShape::setDouble(std::string_view field, double value) {
    return set(field, ShapeValue(value));
}

QueryShape& QueryShape::setBool(std::string_view field, bool value) {
    return set(field, ShapeValue(value));
}

QueryShape& QueryShape::setNull(std::string_view field) {
    return set(field, ShapeValue(DbNull{}));
}

QueryShape& QueryShape::setList(std::string_view field, ShapeList values) {
    return set(field, ShapeValue(std::move(values)));
}

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

CacheResult<void> invalidShape(std::string message) {
    return CacheResult<void>::err(
        CacheError(ErrorCode::InvalidShape, std::move(message)));
}

CacheResult<void> appendShapeScalar(std::string& out, std::string_view field,
                                    const DbValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) {
        if (!json::isValidUtf8(*s)) {
            return invalidShape("field '" + std::string(field) +
                                "' holds a string that is not valid UTF-8");
        }
    }
    auto appended = json::appendScalar(out, value);
    if (appended.hasError()) {
        return invalidShape("field '" + std::string(field) +
                            "' holds a non-finite number");
    }
    return CacheResult<void>::ok();
}

CacheResult<void> appendShapeValue(std::string& out, std::string_view field,
                                   const ShapeValue& value) {
    return std::visit([&](auto&& arg) -> CacheResult<void> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, ShapeList>) {
            out += '[';
            bool first = true;
            for (const auto& item : arg) {
                if (!first) {
                    out += ',';
                }
                first = false;
                auto appended = appendShapeScalar(out, field, item);
                if (appended.hasError()) {
                    return appended;
                }
            }
            out += ']';
            return CacheResult<void>::ok();
        } else {
            return appendShapeScalar(out, field, DbValue(arg));
        }
    }, value);
}

std::string toHex(const unsigned char* data, std::size_t length) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        result.push_back(hexChars[(data[i] >> 4) & 0x0F]);
        result.push_back(hexChars[data[i] & 0x0F]);
    }
    return result;
}

} // namespace

// ── KeyDeriver ──────────────────────────────────────────────────────────────

CacheResult<std::string> KeyDeriver::canonicalize(const QueryShape& shape) {
    std::string out;
    out += '{';
    bool first = true;
    // std::map iterates in byte order of the field names.
    for (const auto& [field, value] : shape.fields()) {
        if (field.empty()) {
            return CacheResult<std::string>::err(
                CacheError(ErrorCode::InvalidShape, "shape field name is empty"));
        }
        if (!json::isValidUtf8(field)) {
            return CacheResult<std::string>::err(
                CacheError(ErrorCode::InvalidShape,
                           "shape field name is not valid UTF-8"));
        }
        if (!first) {
            out += ',';
        }
        first = false;
        json::appendString(out, field);
        out += ':';
        auto appended = appendShapeValue(out, field, value);
        if (appended.hasError()) {
            return CacheResult<std::string>::err(appended.error());
        }
    }
    out += '}';
    return CacheResult<std::string>::ok(std::move(out));
}

CacheResult<void> KeyDeriver::validateNamespace(std::string_view ns) {
    if (ns.empty()) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::InvalidNamespace, "namespace is empty"));
    }
    if (ns.find(kSeparator) != std::string_view::npos) {
        return CacheResult<void>::err(
            CacheError(ErrorCode::InvalidNamespace,
                       "namespace must not contain ':': " + std::string(ns)));
    }
    return CacheResult<void>::ok();
}

std::string KeyDeriver::prefixFor(std::string_view ns) {
    std::string prefix(ns);
    prefix += kSeparator;
    return prefix;
}

CacheResult<std::string> KeyDeriver::deriveKey(std::string_view ns,
                                               const QueryShape& shape) {
    auto nsCheck = validateNamespace(ns);
    if (nsCheck.hasError()) {
        return CacheResult<std::string>::err(nsCheck.error());
    }

    auto canonical = canonicalize(shape);
    if (canonical.hasError()) {
        return canonical;
    }

    const auto& text = canonical.value();
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    if (EVP_Digest(text.data(), text.size(), digest.data(), &digestLen,
                   EVP_sha256(), nullptr) != 1) {
        return CacheResult<std::string>::err(
            CacheError(ErrorCode::Unknown, "SHA-256 digest computation failed"));
    }

    auto key = prefixFor(ns);
    key += toHex(digest.data(), digestLen);
    return CacheResult<std::string>::ok(std::move(key));
}

} // namespace qrc::cache
