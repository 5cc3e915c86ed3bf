#pragma once

/// @file clock.hpp
/// @brief Wall-clock time source shared by both cache tiers.

#include <chrono>
#include <memory>

namespace qrc::cache {

using TimePoint = std::chrono::system_clock::time_point;

/// Source of "now" for createdAt/expiresAt arithmetic.
///
/// Wall-clock rather than steady time because durable expiry timestamps
/// must stay meaningful across process restarts.
class Clock {
public:
    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
};

/// Clock backed by std::chrono::system_clock.
class SystemClock final : public Clock {
public:
    [[nodiscard]] TimePoint now() const override;
};

/// Process-wide SystemClock instance.
[[nodiscard]] std::shared_ptr<Clock> systemClock();

} // namespace qrc::cache
