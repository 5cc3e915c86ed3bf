#pragma once

/// @file cache_error.hpp
/// @brief Error type used with Result<T, CacheError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "qrc/foundation/error_code.hpp"

namespace qrc::foundation {

/// Error carrying a categorized code, a human-readable message and
/// optional type-erased context (e.g. the underlying database error).
class CacheError {
public:
    CacheError() = default;

    explicit CacheError(ErrorCode code)
        : code_(code) {}

    CacheError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    CacheError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr if empty or of another type).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace qrc::foundation
