// src/core/tick_clock.cpp
#include "tick_clock.h"
#include <chrono>

int64_t SteadyTickClock::now_ticks() {
    static_assert(std::chrono::steady_clock::is_steady, "steady_clock must be steady");
    return static_cast<int64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count());
}

int64_t SteadyTickClock::frequency() {
    using period = std::chrono::steady_clock::period;
    return static_cast<int64_t>(period::den / period::num);
}
