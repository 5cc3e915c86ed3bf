/// @file clock.cpp

#include "qrc/cache/clock.hpp"

namespace qrc::cache {

TimePoint SystemClock::now() const {
    return std::chrono::system_clock::now();
}

std::shared_ptr<Clock> systemClock() {
    static const auto clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace qrc::cache
