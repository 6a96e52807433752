// src/core/tick_clock.h
#pragma once

#include <cstdint>

// Monotonic clock expressed in integer ticks.
class TickClock {
public:
    virtual ~TickClock() = default;

    virtual int64_t now_ticks() = 0;
    // Ticks per second.
    virtual int64_t frequency() = 0;
};

// std::chrono::steady_clock in its native period (nanoseconds on Linux).
class SteadyTickClock : public TickClock {
public:
    int64_t now_ticks() override;
    int64_t frequency() override;
};
