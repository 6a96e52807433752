// src/core/precision_waiter.h
#pragma once

#include <cstdint>
#include "tick_clock.h"
#include "precision_sleep.h"

// Blocks the calling thread until a clock timestamp is reached.
class Waiter {
public:
    virtual ~Waiter() = default;

    virtual void wait_until(int64_t target_ticks, int64_t clock_frequency) = 0;
};

// Hybrid wait: coarse sleeps down to the spin threshold, then a tight
// spin on the clock for the remainder.
class PrecisionWaiter : public Waiter {
public:
    static constexpr int64_t kDefaultSpinThresholdNs = 80000; // 0.08 ms
    static constexpr int64_t kMaxSleepChunkNs = 3600LL * 1000000000LL; // 1 h

    PrecisionWaiter(TickClock& clock, PrecisionSleep& sleeper,
                    int64_t spin_threshold_ns = kDefaultSpinThresholdNs);

    void wait_until(int64_t target_ticks, int64_t clock_frequency) override;

    int64_t get_spin_threshold_ns() const { return m_spin_threshold_ns; }

private:
    void spin_until(int64_t target_ticks);

    TickClock& m_clock;
    PrecisionSleep& m_sleeper;
    int64_t m_spin_threshold_ns;
};

// Tells the CPU the caller is in a spin-wait loop.
void cpu_relax();
