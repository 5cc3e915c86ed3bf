/// @file canonical_json.cpp
/// @brief Canonical JSON writer and a small reader for it.

#include "qrc/cache/canonical_json.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <type_traits>

namespace qrc::cache::json {

using qrc::foundation::CacheError;
using qrc::foundation::CacheResult;
using qrc::foundation::DbNull;
using qrc::foundation::DbValue;
using qrc::foundation::ErrorCode;

// ── Writer ──────────────────────────────────────────────────────────────────

void appendString(std::string& out, std::string_view value) {
    static constexpr char hexChars[] = "0123456789abcdef";

    out.reserve(out.size() + value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: {
                auto uc = static_cast<unsigned char>(c);
                if (uc < 0x20) {
                    out += "\\u00";
                    out += hexChars[(uc >> 4) & 0x0F];
                    out += hexChars[uc & 0x0F];
                } else {
                    out += c;
                }
            }
        }
    }
    out += '"';
}

CacheResult<void> appendScalar(std::string& out, const DbValue& value) {
    return std::visit([&out](auto&& arg) -> CacheResult<void> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, DbNull>) {
            out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            out += arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
            out += std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(arg)) {
                return CacheResult<void>::err(
                    CacheError(ErrorCode::InvalidArgument,
                               "non-finite number has no JSON form"));
            }
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), arg);
            std::string_view text(buf, static_cast<std::size_t>(ptr - buf));
            out += text;
            if (text.find_first_of(".e") == std::string_view::npos) {
                out += ".0";
            }
        } else {
            appendString(out, arg);
        }
        return CacheResult<void>::ok();
    }, value);
}

bool isValidUtf8(std::string_view text) {
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        uint32_t cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (i + len > n) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto b = static_cast<unsigned char>(text[i + k]);
            if ((b & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        bool overlong = (len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) ||
                        (len == 4 && cp < 0x10000);
        if (overlong || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += len;
    }
    return true;
}

// ── Reader ──────────────────────────────────────────────────────────────────

namespace {

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

void Reader::skipWhitespace() {
    while (pos_ < text_.size() &&
           (text_[pos_] == ' ' || text_[pos_] == '\t' ||
            text_[pos_] == '\n' || text_[pos_] == '\r')) {
        ++pos_;
    }
}

char Reader::peek() {
    skipWhitespace();
    return pos_ < text_.size() ? text_[pos_] : '\0';
}

bool Reader::consume(char c) {
    if (peek() == c) {
        ++pos_;
        return true;
    }
    return false;
}

bool Reader::atEnd() {
    skipWhitespace();
    return pos_ >= text_.size();
}

bool Reader::readHex4(uint32_t& out) {
    if (pos_ + 4 > text_.size()) {
        return false;
    }
    auto first = text_.data() + pos_;
    auto [ptr, ec] = std::from_chars(first, first + 4, out, 16);
    if (ec != std::errc() || ptr != first + 4) {
        return false;
    }
    pos_ += 4;
    return true;
}

bool Reader::readString(std::string& out) {
    if (!consume('"')) {
        return false;
    }
    out.clear();
    while (pos_ < text_.size()) {
        char c = text_[pos_++];
        if (c == '"') {
            return true;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (pos_ >= text_.size()) {
            return false;
        }
        char esc = text_[pos_++];
        switch (esc) {
            case '"':  out += '"'; break;
            case '\\': out += '\\'; break;
            case '/':  out += '/'; break;
            case 'b':  out += '\b'; break;
            case 'f':  out += '\f'; break;
            case 'n':  out += '\n'; break;
            case 'r':  out += '\r'; break;
            case 't':  out += '\t'; break;
            case 'u': {
                uint32_t cp = 0;
                if (!readHex4(cp)) {
                    return false;
                }
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    uint32_t low = 0;
                    if (pos_ + 2 > text_.size() || text_[pos_] != '\\' ||
                        text_[pos_ + 1] != 'u') {
                        return false;
                    }
                    pos_ += 2;
                    if (!readHex4(low) || low < 0xDC00 || low > 0xDFFF) {
                        return false;
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    return false;
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                return false;
        }
    }
    return false;
}

bool Reader::readLiteral(std::string_view literal) {
    if (text_.substr(pos_, literal.size()) != literal) {
        return false;
    }
    pos_ += literal.size();
    return true;
}

bool Reader::readNumber(DbValue& out) {
    auto start = pos_;
    bool isFloat = false;
    while (pos_ < text_.size()) {
        char c = text_[pos_];
        if (c == '.' || c == 'e' || c == 'E') {
            isFloat = true;
        } else if (!(c == '-' || c == '+' || (c >= '0' && c <= '9'))) {
            break;
        }
        ++pos_;
    }
    if (pos_ == start) {
        return false;
    }

    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    if (!isFloat) {
        std::int64_t intValue = 0;
        auto [ptr, ec] = std::from_chars(first, last, intValue);
        if (ec == std::errc() && ptr == last) {
            out = intValue;
            return true;
        }
    }
    double doubleValue = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, doubleValue);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    out = doubleValue;
    return true;
}

bool Reader::readScalar(DbValue& out) {
    switch (peek()) {
        case 'n':
            out = DbNull{};
            return readLiteral("null");
        case 't':
            out = true;
            return readLiteral("true");
        case 'f':
            out = false;
            return readLiteral("false");
        case '"': {
            std::string s;
            if (!readString(s)) {
                return false;
            }
            out = std::move(s);
            return true;
        }
        default:
            return readNumber(out);
    }
}

} // namespace qrc::cache::json
