// src/core/precision_sleep.h
#pragma once

#include <cstdint>
#include <memory>
#include <string>

enum class SleepKind {
    AUTO,
    NANOSLEEP,
    COARSE
};

// Relative sleep capability. Implementations may wake early or late;
// callers re-measure the clock after every call.
class PrecisionSleep {
public:
    virtual ~PrecisionSleep() = default;

    virtual void sleep_nanoseconds(int64_t ns) = 0;
    virtual std::string name() const = 0;
};

// clock_nanosleep(CLOCK_MONOTONIC) relative sleep. EINTR is an early wake.
class NanosleepPrecisionSleep : public PrecisionSleep {
public:
    void sleep_nanoseconds(int64_t ns) override;
    std::string name() const override { return "nanosleep"; }

    // True when the build target exposes clock_nanosleep.
    static bool available();
};

// Millisecond sleep for the whole-ms part, a zero-length yield below 1 ms.
class CoarsePrecisionSleep : public PrecisionSleep {
public:
    void sleep_nanoseconds(int64_t ns) override;
    std::string name() const override { return "coarse"; }
};

std::unique_ptr<PrecisionSleep> make_precision_sleep(SleepKind kind);

// Throws std::runtime_error on an unknown name.
SleepKind sleep_kind_from_string(const std::string& name);
std::string sleep_kind_to_string(SleepKind kind);
