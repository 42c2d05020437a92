#include "clock.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace betme {

std::uint64_t SystemClock::now() const {
    auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch).count();
    if (seconds < 0) {
        throw std::runtime_error("system clock is before the unix epoch");
    }
    return static_cast<std::uint64_t>(seconds);
}

void ManualClock::set(std::uint64_t timestamp) {
    if (timestamp < now_) {
        throw std::invalid_argument("clock cannot move backwards");
    }
    now_ = timestamp;
}

void ManualClock::advance(std::uint64_t seconds) {
    if (seconds > std::numeric_limits<std::uint64_t>::max() - now_) {
        throw std::overflow_error("clock advance overflows");
    }
    now_ += seconds;
}

} // namespace betme
