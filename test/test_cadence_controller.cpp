#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/cadence_controller.h"
#include "fake_time.h"

constexpr int64_t kFrequency = 1000000;   // 1 tick = 1 us

class CadenceControllerTest : public ::testing::Test {
protected:
    CadenceControllerTest() : clock(kFrequency, 0), waiter(clock), controller(clock, waiter) {}

    FakeClock clock;
    FakeWaiter waiter;
    CadenceController controller;
};

// ============================================================================
// Test Suite: Configuration
// ============================================================================

TEST_F(CadenceControllerTest, StartsUnconfigured) {
    EXPECT_EQ(controller.get_state(), PacerState::UNCONFIGURED);
    EXPECT_EQ(controller.get_interval_ticks(), 0);
    EXPECT_DOUBLE_EQ(controller.get_target(), 0.0);
}

TEST_F(CadenceControllerTest, BoundedRateComputesTruncatedInterval) {
    EXPECT_DOUBLE_EQ(controller.set_target(100.0), 100.0);
    EXPECT_EQ(controller.get_interval_ticks(), 10000);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_BOUNDED);

    controller.set_target(60.0);
    EXPECT_EQ(controller.get_interval_ticks(), 16666);   // 16666.67 truncated
    EXPECT_EQ(controller.get_clock_frequency(), kFrequency);
}

TEST_F(CadenceControllerTest, RateChangeReschedulesFromNow) {
    controller.set_target(100.0);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 10000);

    controller.tick();
    EXPECT_EQ(controller.get_next_boundary_ticks(), 20000);

    clock.advance(3000);   // now = 13000
    controller.set_target(50.0);
    EXPECT_EQ(controller.get_interval_ticks(), 20000);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 13000 + 20000);
}

TEST_F(CadenceControllerTest, RateChangeRereadsClockFrequency) {
    controller.set_target(100.0);
    clock.set_frequency(2000000);
    controller.set_target(100.0);
    EXPECT_EQ(controller.get_clock_frequency(), 2000000);
    EXPECT_EQ(controller.get_interval_ticks(), 20000);

    controller.tick();
    ASSERT_EQ(waiter.frequencies.size(), 1u);
    EXPECT_EQ(waiter.frequencies[0], 2000000);
}

TEST_F(CadenceControllerTest, RateAboveClockResolutionClampsToOneTick) {
    controller.set_target(5.0e6);
    EXPECT_EQ(controller.get_interval_ticks(), 1);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_BOUNDED);
}

TEST(CadenceControllerRange, TinyRateClampsToLargeInterval) {
    FakeClock clock(1000000000, 1000);
    FakeWaiter waiter(clock);
    CadenceController controller(clock, waiter);

    EXPECT_DOUBLE_EQ(controller.set_target(1e-12), 1e-12);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_BOUNDED);
    EXPECT_EQ(controller.get_interval_ticks(), CadenceController::kMaxIntervalTicks);
    EXPECT_GT(controller.get_next_boundary_ticks(), 1000);

    controller.tick();
    ASSERT_EQ(waiter.targets.size(), 1u);
    EXPECT_EQ(waiter.targets[0], 1000 + CadenceController::kMaxIntervalTicks);
    EXPECT_EQ(controller.get_next_boundary_ticks(),
              1000 + 2 * CadenceController::kMaxIntervalTicks);
    EXPECT_EQ(controller.get_stats().resyncs, 0u);
}

TEST(CadenceControllerRange, SmallRateWithinRangeIsNotClamped) {
    FakeClock clock(1000000000, 0);
    FakeWaiter waiter(clock);
    CadenceController controller(clock, waiter);

    controller.set_target(0.5);   // one tick every 2 s
    EXPECT_EQ(controller.get_interval_ticks(), 2000000000LL);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 2000000000LL);
}

TEST(CadenceControllerRange, LateClockShrinksIntervalCap) {
    const int64_t start = INT64_MAX - 4000;
    FakeClock clock(1000000000, start);
    FakeWaiter waiter(clock);
    CadenceController controller(clock, waiter);

    controller.set_target(1e-12);
    EXPECT_EQ(controller.get_interval_ticks(), 1000);
    EXPECT_EQ(controller.get_next_boundary_ticks(), start + 1000);
}

// ============================================================================
// Test Suite: Unlimited mode and invalid input
// ============================================================================

TEST_F(CadenceControllerTest, ZeroRateIsUnlimitedFromBoundedState) {
    int calls = 0;
    controller.set_callback([&calls]() { ++calls; });
    controller.set_target(100.0);
    controller.tick();
    ASSERT_EQ(waiter.targets.size(), 1u);

    EXPECT_DOUBLE_EQ(controller.set_target(0.0), 0.0);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_UNLIMITED);
    EXPECT_EQ(controller.get_interval_ticks(), 0);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 0);

    for (int i = 0; i < 5; ++i) {
        controller.tick();
    }
    EXPECT_EQ(calls, 6);
    EXPECT_EQ(waiter.targets.size(), 1u);
}

TEST_F(CadenceControllerTest, NegativeRateIsUnlimitedFromUnconfiguredState) {
    int calls = 0;
    controller.set_callback([&calls]() { ++calls; });

    EXPECT_DOUBLE_EQ(controller.set_target(-5.0), 0.0);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_UNLIMITED);

    controller.tick();
    controller.tick();
    EXPECT_EQ(calls, 2);
    EXPECT_TRUE(waiter.targets.empty());
    EXPECT_EQ(clock.peek(), 0);
}

TEST_F(CadenceControllerTest, NaNDisablesLimiter) {
    controller.set_target(100.0);
    EXPECT_DOUBLE_EQ(controller.set_target(std::numeric_limits<double>::quiet_NaN()), 0.0);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_UNLIMITED);
    EXPECT_EQ(controller.get_interval_ticks(), 0);

    controller.tick();
    EXPECT_TRUE(waiter.targets.empty());
}

TEST_F(CadenceControllerTest, InfinityDisablesLimiter) {
    controller.set_target(100.0);
    EXPECT_DOUBLE_EQ(controller.set_target(std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_UNLIMITED);

    EXPECT_DOUBLE_EQ(controller.set_target(-std::numeric_limits<double>::infinity()), 0.0);
    EXPECT_EQ(controller.get_interval_ticks(), 0);
}

TEST_F(CadenceControllerTest, UnconfiguredTickRunsCallbackWithoutPacing) {
    int calls = 0;
    controller.set_callback([&calls]() { ++calls; });
    controller.tick();
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(waiter.targets.empty());
    EXPECT_EQ(controller.get_state(), PacerState::UNCONFIGURED);
}

// ============================================================================
// Test Suite: Fixed schedule
// ============================================================================

TEST_F(CadenceControllerTest, OvershootDoesNotShiftBoundaries) {
    controller.set_target(100.0);
    waiter.overshoot = 50;
    EXPECT_EQ(controller.get_next_boundary_ticks(), 10000);

    controller.tick();
    EXPECT_EQ(controller.get_next_boundary_ticks(), 20000);
    controller.tick();
    EXPECT_EQ(controller.get_next_boundary_ticks(), 30000);
    controller.tick();
    EXPECT_EQ(controller.get_next_boundary_ticks(), 40000);

    EXPECT_EQ(waiter.targets, (std::vector<int64_t>{10000, 20000, 30000}));
    EXPECT_EQ(clock.peek(), 30050);

    PacerStats stats = controller.get_stats();
    EXPECT_EQ(stats.waits, 3u);
    EXPECT_EQ(stats.last_overshoot_ticks, 50);
    EXPECT_EQ(stats.max_overshoot_ticks, 50);
}

TEST_F(CadenceControllerTest, BoundariesFormArithmeticSequence) {
    controller.set_target(60.0);
    const int64_t interval = controller.get_interval_ticks();

    for (int i = 0; i < 200; ++i) {
        controller.tick();
    }

    ASSERT_EQ(waiter.targets.size(), 200u);
    for (size_t i = 0; i < waiter.targets.size(); ++i) {
        EXPECT_EQ(waiter.targets[i], interval * static_cast<int64_t>(i + 1));
    }
}

TEST_F(CadenceControllerTest, BoundedJitterNeverMovesSchedule) {
    controller.set_target(100.0);   // interval 10000

    std::mt19937 gen(1234);
    std::uniform_int_distribution<int64_t> work(0, 7999);
    std::uniform_int_distribution<int64_t> wake(0, 900);
    for (int i = 0; i < 64; ++i) {
        waiter.jitter.push_back(wake(gen));
    }
    controller.set_callback([&]() { clock.advance(work(gen)); });

    for (int i = 0; i < 500; ++i) {
        controller.tick();
    }

    ASSERT_EQ(waiter.targets.size(), 500u);
    for (size_t i = 0; i < waiter.targets.size(); ++i) {
        EXPECT_EQ(waiter.targets[i], 10000 * static_cast<int64_t>(i + 1));
    }
    EXPECT_EQ(controller.get_stats().resyncs, 0u);
}

TEST_F(CadenceControllerTest, LateTickSkipsWaitButKeepsSchedule) {
    controller.set_target(100.0);
    controller.tick();                       // now 10000, next 20000

    clock.advance(15000);                    // now 25000, past the boundary
    controller.tick();
    EXPECT_EQ(waiter.targets.size(), 1u);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 30000);
    EXPECT_EQ(controller.get_stats().late_ticks, 1u);

    controller.tick();
    ASSERT_EQ(waiter.targets.size(), 2u);
    EXPECT_EQ(waiter.targets[1], 30000);
}

// ============================================================================
// Test Suite: Stall resynchronization
// ============================================================================

TEST_F(CadenceControllerTest, LongStallResyncsFromNow) {
    controller.set_target(100.0);
    controller.tick();                       // now 10000, next 20000

    const int64_t stalled_now = 20000 + 2 * 10000 + 1;
    clock.set(stalled_now);
    controller.tick();

    EXPECT_EQ(controller.get_next_boundary_ticks(), stalled_now + 10000);
    EXPECT_EQ(controller.get_stats().resyncs, 1u);
    EXPECT_EQ(waiter.targets.size(), 1u);    // no catch-up waits

    controller.tick();
    controller.tick();
    ASSERT_EQ(waiter.targets.size(), 3u);
    EXPECT_EQ(waiter.targets[1], stalled_now + 10000);
    EXPECT_EQ(waiter.targets[2], stalled_now + 20000);
}

TEST_F(CadenceControllerTest, StallOfExactlyTwoIntervalsDoesNotResync) {
    controller.set_target(100.0);
    controller.tick();                       // next 20000

    clock.set(40000);
    controller.tick();
    EXPECT_EQ(controller.get_next_boundary_ticks(), 30000);
    EXPECT_EQ(controller.get_stats().resyncs, 0u);
}

TEST_F(CadenceControllerTest, StallInsideCallbackResyncs) {
    controller.set_target(100.0);
    bool stall = false;
    controller.set_callback([&]() {
        if (stall) clock.advance(1000000);  // one second
    });
    controller.tick();                       // now 10000, next 20000

    stall = true;
    controller.tick();                       // now 1010000
    EXPECT_EQ(controller.get_next_boundary_ticks(), 1010000 + 10000);
    EXPECT_EQ(controller.get_stats().resyncs, 1u);
}

// ============================================================================
// Test Suite: Callback
// ============================================================================

TEST_F(CadenceControllerTest, LastCallbackWins) {
    int first = 0;
    int second = 0;
    controller.set_callback([&first]() { ++first; });
    controller.set_callback([&second]() { ++second; });
    controller.tick();
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);

    controller.clear_callback();
    controller.tick();
    EXPECT_EQ(second, 1);
}

TEST_F(CadenceControllerTest, CallbackFailurePropagates) {
    controller.set_target(100.0);
    controller.set_callback([]() { throw std::runtime_error("work failed"); });

    EXPECT_THROW(controller.tick(), std::runtime_error);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 10000);
    EXPECT_TRUE(waiter.targets.empty());
    EXPECT_EQ(controller.get_stats().ticks, 0u);
}

TEST_F(CadenceControllerTest, CallbackCompletesBeforeWaitAndWaitBeforeNextCallback) {
    controller.set_target(100.0);
    std::vector<int64_t> callback_times;
    controller.set_callback([&]() { callback_times.push_back(clock.peek()); });

    for (int i = 0; i < 4; ++i) {
        controller.tick();
    }

    ASSERT_EQ(callback_times.size(), 4u);
    ASSERT_EQ(waiter.targets.size(), 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_LT(callback_times[i], waiter.targets[i]);
        if (i + 1 < 4) {
            EXPECT_GE(callback_times[i + 1], waiter.targets[i]);
        }
    }
}

// ============================================================================
// Test Suite: Lifecycle
// ============================================================================

TEST_F(CadenceControllerTest, InitializeAttachesAndAppliesRate) {
    FakeAttachment attachment;
    int calls = 0;
    controller.set_callback([&calls]() { ++calls; });

    ASSERT_TRUE(controller.initialize(attachment, 100.0));
    EXPECT_EQ(attachment.attach_calls, 1);
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_BOUNDED);

    attachment.frame();
    attachment.frame();
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(waiter.targets, (std::vector<int64_t>{10000, 20000}));

    EXPECT_FALSE(controller.initialize(attachment, 30.0));
}

TEST_F(CadenceControllerTest, InitializeWithNaNStartsUnlimited) {
    FakeAttachment attachment;
    ASSERT_TRUE(controller.initialize(attachment, std::nan("")));
    EXPECT_EQ(controller.get_state(), PacerState::ACTIVE_UNLIMITED);
}

TEST_F(CadenceControllerTest, ShutdownIsTerminal) {
    FakeAttachment attachment;
    int calls = 0;
    controller.set_callback([&calls]() { ++calls; });
    ASSERT_TRUE(controller.initialize(attachment, 100.0));

    controller.shutdown();
    EXPECT_EQ(controller.get_state(), PacerState::STOPPED);
    EXPECT_EQ(attachment.detach_calls, 1);
    EXPECT_FALSE(attachment.attached);

    controller.tick();
    EXPECT_EQ(calls, 0);

    EXPECT_DOUBLE_EQ(controller.set_target(30.0), 100.0);
    EXPECT_EQ(controller.get_state(), PacerState::STOPPED);
    EXPECT_FALSE(controller.initialize(attachment, 30.0));

    controller.shutdown();
    EXPECT_EQ(attachment.detach_calls, 1);
}

TEST_F(CadenceControllerTest, ShutdownFromCallbackSkipsWait) {
    FakeAttachment attachment;
    ASSERT_TRUE(controller.initialize(attachment, 100.0));
    controller.set_callback([this]() { controller.shutdown(); });

    attachment.frame();
    EXPECT_EQ(controller.get_state(), PacerState::STOPPED);
    EXPECT_TRUE(waiter.targets.empty());
    EXPECT_EQ(attachment.detach_calls, 1);
}

TEST_F(CadenceControllerTest, RateChangeDuringWaitWinsOverInFlightAdvance) {
    controller.set_target(100.0);
    waiter.during_wait = [this]() { controller.set_target(50.0); };

    controller.tick();
    EXPECT_EQ(controller.get_interval_ticks(), 20000);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 20000);   // set at now = 0

    waiter.during_wait = nullptr;
    controller.tick();
    EXPECT_EQ(waiter.targets.back(), 20000);
    EXPECT_EQ(controller.get_next_boundary_ticks(), 40000);
}

TEST_F(CadenceControllerTest, PacingReportIsLoggedEveryInterval) {
    controller.set_target(100.0);
    controller.set_stats_log_interval(2);

    testing::internal::CaptureStdout();
    controller.tick();
    controller.tick();
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("[PACER] target=100.000Hz ticks=2"), std::string::npos);
}
