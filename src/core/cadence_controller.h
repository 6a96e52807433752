// src/core/cadence_controller.h
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "tick_clock.h"
#include "precision_waiter.h"
#include "scheduler_attachment.h"
#include "state_machine.h"

struct PacerStats {
    uint64_t ticks = 0;
    uint64_t waits = 0;
    uint64_t late_ticks = 0;     // boundary already passed, no wait
    uint64_t resyncs = 0;
    int64_t last_overshoot_ticks = 0;
    int64_t max_overshoot_ticks = 0;
};

// Runs one callback per tick and holds the tick stream to a fixed schedule.
//
// Boundaries advance by a constant interval regardless of the actual wake
// time, so jitter never shifts later boundaries. After a stall longer than
// one extra interval the schedule restarts from the present instead of
// running missed cycles back to back.
//
// NaN and infinite rates disable the limiter (unlimited), as do rates <= 0.
class CadenceController {
public:
    using TickCallback = std::function<void()>;

    // Largest interval set_target() produces; keeps boundary arithmetic in range.
    static constexpr int64_t kMaxIntervalTicks = INT64_MAX / 8;

    CadenceController(TickClock& clock, Waiter& waiter);
    ~CadenceController();

    CadenceController(const CadenceController&) = delete;
    CadenceController& operator=(const CadenceController&) = delete;

    // Applies refresh_rate and registers tick() with the attachment.
    bool initialize(SchedulerAttachment& attachment, double refresh_rate);

    // Returns the effective target rate, 0 when unlimited.
    double set_target(double refresh_rate);
    double get_target() const;

    void set_callback(TickCallback callback);
    void clear_callback();

    void tick();

    // Clears the callback, detaches and enters STOPPED.
    void shutdown();

    PacerState get_state() const;
    std::string get_state_name() const;
    int64_t get_interval_ticks() const;
    int64_t get_next_boundary_ticks() const;
    int64_t get_clock_frequency() const;
    PacerStats get_stats() const;

    // Ticks between pacing reports, 0 disables them.
    void set_stats_log_interval(uint64_t ticks);

private:
    void record_overshoot(int64_t overshoot_ticks);
    void log_pacing_report() const;

    TickClock& m_clock;
    Waiter& m_waiter;
    SchedulerAttachment* m_attachment = nullptr;

    mutable std::mutex m_mutex;
    StateMachine m_state_machine;
    std::shared_ptr<TickCallback> m_callback;

    double m_target_refresh_rate = 0.0;
    int64_t m_interval_ticks = 0;
    int64_t m_next_boundary_ticks = 0;
    int64_t m_frequency = 0;
    uint64_t m_schedule_generation = 0;

    PacerStats m_stats;
    uint64_t m_stats_log_interval = 0;
};
