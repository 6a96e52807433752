// src/core/precision_sleep.cpp
#include "precision_sleep.h"
#include <chrono>
#include <thread>
#include <stdexcept>
#include <iostream>
#include <cerrno>
#include <ctime>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

#if defined(_POSIX_TIMERS) && (_POSIX_TIMERS > 0) && defined(_POSIX_MONOTONIC_CLOCK)
#define PACER_HAS_CLOCK_NANOSLEEP 1
#else
#define PACER_HAS_CLOCK_NANOSLEEP 0
#endif

namespace {
constexpr int64_t kNanosPerSecond = 1000000000;
constexpr int64_t kNanosPerMilli = 1000000;
}

bool NanosleepPrecisionSleep::available() {
    return PACER_HAS_CLOCK_NANOSLEEP != 0;
}

void NanosleepPrecisionSleep::sleep_nanoseconds(int64_t ns) {
    if (ns <= 0) {
        std::this_thread::yield();
        return;
    }
#if PACER_HAS_CLOCK_NANOSLEEP
    timespec req{};
    req.tv_sec = static_cast<time_t>(ns / kNanosPerSecond);
    req.tv_nsec = static_cast<long>(ns % kNanosPerSecond);

    // Interrupted sleeps return early; the waiter re-measures.
    int rc = clock_nanosleep(CLOCK_MONOTONIC, 0, &req, nullptr);
    if (rc != 0 && rc != EINTR) {
        std::cerr << "[WAIT] clock_nanosleep failed (" << rc
                  << "), yielding instead" << std::endl;
        std::this_thread::yield();
    }
#else
    std::this_thread::sleep_for(std::chrono::nanoseconds(ns));
#endif
}

void CoarsePrecisionSleep::sleep_nanoseconds(int64_t ns) {
    if (ns >= kNanosPerMilli) {
        std::this_thread::sleep_for(std::chrono::milliseconds(ns / kNanosPerMilli));
    } else {
        std::this_thread::yield();
    }
}

std::unique_ptr<PrecisionSleep> make_precision_sleep(SleepKind kind) {
    switch (kind) {
        case SleepKind::NANOSLEEP:
            if (!NanosleepPrecisionSleep::available()) {
                std::cerr << "[WAIT] nanosleep not available on this platform, using coarse sleep"
                          << std::endl;
                return std::make_unique<CoarsePrecisionSleep>();
            }
            return std::make_unique<NanosleepPrecisionSleep>();
        case SleepKind::COARSE:
            return std::make_unique<CoarsePrecisionSleep>();
        case SleepKind::AUTO:
        default:
            if (NanosleepPrecisionSleep::available()) {
                return std::make_unique<NanosleepPrecisionSleep>();
            }
            return std::make_unique<CoarsePrecisionSleep>();
    }
}

SleepKind sleep_kind_from_string(const std::string& name) {
    if (name == "auto") return SleepKind::AUTO;
    if (name == "nanosleep") return SleepKind::NANOSLEEP;
    if (name == "coarse") return SleepKind::COARSE;
    throw std::runtime_error("Unknown sleep kind: " + name);
}

std::string sleep_kind_to_string(SleepKind kind) {
    switch (kind) {
        case SleepKind::AUTO: return "auto";
        case SleepKind::NANOSLEEP: return "nanosleep";
        case SleepKind::COARSE: return "coarse";
        default: return "unknown";
    }
}
