// src/core/cadence_controller.cpp
#include "cadence_controller.h"
#include <cmath>
#include <iostream>
#include <iomanip>
#include <limits>

CadenceController::CadenceController(TickClock& clock, Waiter& waiter)
    : m_clock(clock), m_waiter(waiter) {}

CadenceController::~CadenceController() {
    shutdown();
}

bool CadenceController::initialize(SchedulerAttachment& attachment, double refresh_rate) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state_machine.get_current_state() == PacerState::STOPPED) {
            std::cerr << "[PACER] Cannot initialize a stopped pacer." << std::endl;
            return false;
        }
        if (m_attachment != nullptr) {
            std::cerr << "[PACER] Already attached to a frame source." << std::endl;
            return false;
        }
        m_attachment = &attachment;
    }

    double effective = set_target(refresh_rate);

    // The first frame may arrive before attach() returns.
    if (!attachment.attach([this]() { this->tick(); })) {
        std::cerr << "[PACER] Frame source refused attachment." << std::endl;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attachment = nullptr;
        return false;
    }

    std::cout << "[PACER] Attached, target = ";
    if (effective > 0.0) {
        std::cout << std::fixed << std::setprecision(3) << effective << " Hz";
    } else {
        std::cout << "unlimited";
    }
    std::cout << std::endl;
    return true;
}

double CadenceController::set_target(double refresh_rate) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state_machine.get_current_state() == PacerState::STOPPED) {
        std::cerr << "[PACER] Ignoring refresh rate " << refresh_rate
                  << " on a stopped pacer." << std::endl;
        return m_target_refresh_rate;
    }

    if (std::isnan(refresh_rate) || std::isinf(refresh_rate)) {
        std::cerr << "[PACER] Invalid refresh rate " << refresh_rate
                  << ". Disabling limiter (unlimited)." << std::endl;
        refresh_rate = 0.0;
    }

    m_frequency = m_clock.frequency();
    ++m_schedule_generation;

    if (refresh_rate <= 0.0) {
        m_target_refresh_rate = 0.0;
        m_interval_ticks = 0;
        m_next_boundary_ticks = 0;
        m_state_machine.set_state(PacerState::ACTIVE_UNLIMITED);
        std::cout << "[PACER] Target refresh rate: unlimited" << std::endl;
        return m_target_refresh_rate;
    }

    int64_t now = m_clock.now_ticks();
    // Boundaries may run up to three intervals ahead of now (resync check).
    int64_t max_interval = kMaxIntervalTicks;
    if (now > 0 && (std::numeric_limits<int64_t>::max() - now) / 4 < max_interval) {
        max_interval = (std::numeric_limits<int64_t>::max() - now) / 4;
    }

    double quotient = static_cast<double>(m_frequency) / refresh_rate;
    int64_t interval = 0;
    if (quotient >= static_cast<double>(max_interval)) {
        std::cerr << "[PACER] Refresh rate " << refresh_rate
                  << " Hz is below the schedulable range, interval clamped to "
                  << max_interval << " ticks." << std::endl;
        interval = max_interval;
    } else if (quotient < 1.0) {
        std::cerr << "[PACER] Refresh rate " << refresh_rate
                  << " Hz exceeds clock resolution (" << m_frequency
                  << " ticks/s), pacing at one tick per cycle." << std::endl;
        interval = 1;
    } else {
        interval = static_cast<int64_t>(quotient);
    }

    m_target_refresh_rate = refresh_rate;
    m_interval_ticks = interval;
    // A new rate never inherits the previous cadence.
    m_next_boundary_ticks = now + m_interval_ticks;
    m_state_machine.set_state(PacerState::ACTIVE_BOUNDED);

    std::cout << "[PACER] Target refresh rate: " << std::fixed << std::setprecision(3)
              << m_target_refresh_rate << " Hz (" << m_interval_ticks
              << " ticks @ " << m_frequency << " ticks/s)" << std::endl;
    return m_target_refresh_rate;
}

double CadenceController::get_target() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_target_refresh_rate;
}

void CadenceController::set_callback(TickCallback callback) {
    std::shared_ptr<TickCallback> next;
    if (callback) {
        next = std::make_shared<TickCallback>(std::move(callback));
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state_machine.get_current_state() == PacerState::STOPPED) {
        std::cerr << "[PACER] Ignoring callback registration on a stopped pacer." << std::endl;
        return;
    }
    m_callback = std::move(next);
}

void CadenceController::clear_callback() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callback.reset();
}

void CadenceController::tick() {
    std::shared_ptr<TickCallback> callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state_machine.get_current_state() == PacerState::STOPPED) {
            return;
        }
        callback = m_callback;
    }

    // 1) Run the paced work. Failures belong to whoever drives tick().
    if (callback && *callback) {
        (*callback)();
    }

    int64_t target = 0;
    int64_t interval = 0;
    int64_t frequency = 0;
    int64_t now = 0;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state_machine.get_current_state() == PacerState::STOPPED) {
            return;
        }
        ++m_stats.ticks;

        // Unlimited / disabled limiter.
        if (m_interval_ticks <= 0) {
            if (m_stats_log_interval > 0 && m_stats.ticks % m_stats_log_interval == 0) {
                log_pacing_report();
            }
            return;
        }

        now = m_clock.now_ticks();
        if (m_next_boundary_ticks <= 0) {
            m_next_boundary_ticks = now + m_interval_ticks;
        }

        target = m_next_boundary_ticks;
        interval = m_interval_ticks;
        frequency = m_frequency;
        generation = m_schedule_generation;
    }

    // 2) Wait for the pre-scheduled boundary, never "now + interval".
    bool waited = false;
    if (now < target) {
        m_waiter.wait_until(target, frequency);
        waited = true;
    }

    int64_t after_wait = m_clock.now_ticks();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_schedule_generation != generation) {
        // set_target() or shutdown() rescheduled while we were waiting.
        return;
    }

    if (waited) {
        ++m_stats.waits;
        record_overshoot(after_wait - target);
    } else {
        ++m_stats.late_ticks;
    }

    // 3) Advance the cadence by exactly one interval.
    m_next_boundary_ticks += interval;

    // 4) Fell behind by more than a full extra interval: restart from now.
    if (after_wait > m_next_boundary_ticks + interval) {
        int64_t behind_ticks = after_wait - m_next_boundary_ticks;
        m_next_boundary_ticks = after_wait + interval;
        ++m_stats.resyncs;
        std::cerr << "[PACER] Fell behind by " << std::fixed << std::setprecision(3)
                  << (static_cast<double>(behind_ticks) * 1000.0 / static_cast<double>(frequency))
                  << " ms, resynchronizing cadence." << std::endl;
    }

    if (m_stats_log_interval > 0 && m_stats.ticks % m_stats_log_interval == 0) {
        log_pacing_report();
    }
}

void CadenceController::shutdown() {
    SchedulerAttachment* attachment = nullptr;
    bool was_running = false;
    uint64_t ticks = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state_machine.get_current_state() == PacerState::STOPPED) {
            return;
        }
        was_running = m_state_machine.is_active() || m_attachment != nullptr;
        m_state_machine.set_state(PacerState::STOPPED);
        m_callback.reset();
        ++m_schedule_generation;
        attachment = m_attachment;
        m_attachment = nullptr;
        ticks = m_stats.ticks;
    }

    if (attachment != nullptr) {
        attachment->detach();
    }

    if (was_running) {
        std::cout << "[PACER] Stopped after " << ticks << " ticks." << std::endl;
    }
}

PacerState CadenceController::get_state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state_machine.get_current_state();
}

std::string CadenceController::get_state_name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state_machine.state_to_string(m_state_machine.get_current_state());
}

int64_t CadenceController::get_interval_ticks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_interval_ticks;
}

int64_t CadenceController::get_next_boundary_ticks() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_next_boundary_ticks;
}

int64_t CadenceController::get_clock_frequency() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_frequency;
}

PacerStats CadenceController::get_stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void CadenceController::set_stats_log_interval(uint64_t ticks) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats_log_interval = ticks;
}

void CadenceController::record_overshoot(int64_t overshoot_ticks) {
    if (overshoot_ticks < 0) {
        overshoot_ticks = 0;
    }
    m_stats.last_overshoot_ticks = overshoot_ticks;
    if (overshoot_ticks > m_stats.max_overshoot_ticks) {
        m_stats.max_overshoot_ticks = overshoot_ticks;
    }
}

// Caller holds m_mutex.
void CadenceController::log_pacing_report() const {
    double to_us = m_frequency > 0 ? 1.0e6 / static_cast<double>(m_frequency) : 0.0;
    std::cout << "[PACER] target=";
    if (m_interval_ticks > 0) {
        std::cout << std::fixed << std::setprecision(3) << m_target_refresh_rate << "Hz";
    } else {
        std::cout << "unlimited";
    }
    std::cout << " ticks=" << m_stats.ticks
              << " waits=" << m_stats.waits
              << " late=" << m_stats.late_ticks
              << " resyncs=" << m_stats.resyncs
              << " overshoot=" << std::fixed << std::setprecision(1)
              << static_cast<double>(m_stats.last_overshoot_ticks) * to_us << "us"
              << " max=" << static_cast<double>(m_stats.max_overshoot_ticks) * to_us << "us"
              << std::endl;
}
