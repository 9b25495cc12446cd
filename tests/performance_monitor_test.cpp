#include <whiteboard-ot/performance_monitor.hpp>

#include <gtest/gtest.h>

using namespace whiteboard_ot;

// -- PerformanceMonitor --------------------------------------------------------

TEST(PerformanceMonitor, starts_with_neutral_metrics) {
    const auto monitor = PerformanceMonitor{};
    const auto m = monitor.snapshot();
    EXPECT_EQ(m.operation_count, 0u);
    EXPECT_EQ(m.average_latency_ms, 0.0);
    EXPECT_EQ(m.conflict_rate, 0.0);
    EXPECT_EQ(m.resolution_success_rate, 1.0);
    EXPECT_EQ(m.operation_throughput, 0.0);
}

TEST(PerformanceMonitor, averages_over_the_rolling_window) {
    auto monitor = PerformanceMonitor{3};
    monitor.record(100.0);
    monitor.record(1.0);
    monitor.record(2.0);
    monitor.record(3.0);

    const auto m = monitor.snapshot();
    EXPECT_EQ(m.operation_count, 4u);
    EXPECT_DOUBLE_EQ(m.average_latency_ms, 2.0);
    EXPECT_DOUBLE_EQ(m.max_latency_ms, 3.0);
}

TEST(PerformanceMonitor, conflict_rate_is_conflicts_per_operation) {
    auto monitor = PerformanceMonitor{};
    monitor.record(1.0, 3);
    monitor.record(1.0, 0);
    monitor.record(1.0, 1);
    monitor.record(1.0, 0);

    const auto m = monitor.snapshot();
    EXPECT_DOUBLE_EQ(m.conflict_rate, 1.0);
    EXPECT_EQ(m.conflict_count, 4u);
}

TEST(PerformanceMonitor, success_rate_counts_handled_conflicts) {
    auto monitor = PerformanceMonitor{};
    monitor.record_resolution(true);
    monitor.record_resolution(true);
    monitor.record_resolution(true);
    monitor.record_resolution(false);
    EXPECT_DOUBLE_EQ(monitor.snapshot().resolution_success_rate, 0.75);
}

TEST(PerformanceMonitor, gauges_and_rejections_are_reported) {
    auto monitor = PerformanceMonitor{};
    monitor.set_gauges(1.5, 4, 17);
    monitor.record_rejection();
    monitor.record_rejection();

    const auto m = monitor.snapshot();
    EXPECT_DOUBLE_EQ(m.memory_usage_mb, 1.5);
    EXPECT_EQ(m.active_users, 4u);
    EXPECT_EQ(m.queue_size, 17u);
    EXPECT_EQ(m.rejected_count, 2u);
    EXPECT_GT(m.last_updated, 0);
}

TEST(PerformanceMonitor, reset_clears_everything_but_the_window_size) {
    auto monitor = PerformanceMonitor{2};
    monitor.record(10.0, 1);
    monitor.record_resolution(false);
    monitor.reset();

    EXPECT_EQ(monitor.snapshot(), PerformanceMonitor{2}.snapshot());

    monitor.record(1.0);
    monitor.record(2.0);
    monitor.record(3.0);
    EXPECT_DOUBLE_EQ(monitor.snapshot().average_latency_ms, 2.5);
}

// -- adjust_throttle --------------------------------------------------------------

TEST(AdjustThrottle, slow_operations_raise_the_delay) {
    const auto config = ThrottleConfig{};
    auto throttling = AdaptiveThrottling{};
    EXPECT_DOUBLE_EQ(adjust_throttle(throttling, 800.0, config), 1200.0);
    EXPECT_DOUBLE_EQ(throttling.current_rate, 1200.0);
}

TEST(AdjustThrottle, delay_is_capped) {
    const auto config = ThrottleConfig{};
    auto throttling = AdaptiveThrottling{};
    for (int i = 0; i < 100; ++i) adjust_throttle(throttling, 10'000.0, config);
    EXPECT_DOUBLE_EQ(throttling.current_rate, config.max_rate);
}

TEST(AdjustThrottle, fast_operations_recover_to_the_floor) {
    const auto config = ThrottleConfig{};
    auto throttling = AdaptiveThrottling{};
    EXPECT_DOUBLE_EQ(adjust_throttle(throttling, 1.0, config), 900.0);
    for (int i = 0; i < 100; ++i) adjust_throttle(throttling, 1.0, config);
    EXPECT_DOUBLE_EQ(throttling.current_rate, config.min_rate);
}

TEST(AdjustThrottle, disabled_throttling_is_left_alone) {
    auto throttling = AdaptiveThrottling{};
    throttling.enabled = false;
    EXPECT_DOUBLE_EQ(adjust_throttle(throttling, 10'000.0, ThrottleConfig{}), 1000.0);
}
