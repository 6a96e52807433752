#include "precision_waiter.h"
#include <thread>
#include <iostream>

#if defined(__x86_64__) || defined(__i386__) || defined(_M_X64) || defined(_M_IX86)
#include <immintrin.h>
#endif

void cpu_relax() {
#if defined(__x86_64__) || defined(__i386__) || defined(_M_X64) || defined(_M_IX86)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

PrecisionWaiter::PrecisionWaiter(TickClock& clock, PrecisionSleep& sleeper,
                                 int64_t spin_threshold_ns)
    : m_clock(clock), m_sleeper(sleeper), m_spin_threshold_ns(spin_threshold_ns) {
    if (m_spin_threshold_ns < 0) {
        std::cerr << "[WAIT] Negative spin threshold " << spin_threshold_ns
                  << "ns, using " << kDefaultSpinThresholdNs << "ns" << std::endl;
        m_spin_threshold_ns = kDefaultSpinThresholdNs;
    }
}

void PrecisionWaiter::wait_until(int64_t target_ticks, int64_t clock_frequency) {
    if (clock_frequency <= 0) {
        spin_until(target_ticks);
        return;
    }

    while (true) {
        int64_t now = m_clock.now_ticks();
        int64_t remaining_ticks = target_ticks - now;
        if (remaining_ticks <= 0) {
            return;
        }

        double remaining_ns = (static_cast<double>(remaining_ticks) * 1.0e9) /
                              static_cast<double>(clock_frequency);

        if (remaining_ns > static_cast<double>(m_spin_threshold_ns)) {
            // Sleep APIs over- and undershoot; measure again after every call.
            // Far targets sleep in bounded chunks.
            double sleep_ns = remaining_ns - static_cast<double>(m_spin_threshold_ns);
            m_sleeper.sleep_nanoseconds(sleep_ns >= static_cast<double>(kMaxSleepChunkNs)
                                            ? kMaxSleepChunkNs
                                            : static_cast<int64_t>(sleep_ns));
            continue;
        }

        spin_until(target_ticks);
        return;
    }
}

void PrecisionWaiter::spin_until(int64_t target_ticks) {
    while (m_clock.now_ticks() < target_ticks) {
        cpu_relax();
    }
}
