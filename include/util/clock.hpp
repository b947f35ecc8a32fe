#pragma once

#include <chrono>
#include <functional>

namespace vcs::util {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Injectable time source; tests substitute a manual clock.
using NowFn = std::function<TimePoint()>;

inline TimePoint systemNow() { return Clock::now(); }

inline std::chrono::milliseconds elapsedMs(const TimePoint since, const TimePoint now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - since);
}

}
