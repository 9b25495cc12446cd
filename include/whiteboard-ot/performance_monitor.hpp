/// @file performance_monitor.hpp
/// @brief Rolling performance statistics and the adaptive throttle.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace whiteboard_ot {

/// A point-in-time view of the engine's or a canvas's performance.
struct PerformanceMetrics {
    std::uint64_t operation_count{0};
    double average_latency_ms{0.0};     ///< Mean over the rolling window.
    double max_latency_ms{0.0};         ///< Max over the rolling window.
    double conflict_rate{0.0};          ///< Conflicts per operation.
    double resolution_success_rate{1.0};  ///< Resolved / handled, 1.0 when none handled.
    double operation_throughput{0.0};   ///< Operations per second since the first record.
    double memory_usage_mb{0.0};        ///< Estimated retained state.
    std::size_t active_users{0};
    std::size_t queue_size{0};
    Millis last_updated{0};
    std::uint64_t rejected_count{0};
    std::uint64_t conflict_count{0};

    auto operator==(const PerformanceMetrics&) const -> bool = default;
};

/// The backpressure signal reported to callers.
///
/// `current_rate` is the suggested delay between operations in
/// microseconds; it grows while latency is above target.
struct AdaptiveThrottling {
    bool enabled{true};
    double current_rate{1000.0};
    double target_latency_ms{500.0};

    auto operator==(const AdaptiveThrottling&) const -> bool = default;
};

/// Feed one observed latency into the throttle.
///
/// Above target the rate is multiplied by `increase_factor` up to
/// `max_rate`; otherwise by `recovery_factor` down to `min_rate`. A
/// disabled throttle is left untouched.
/// @return The new current rate.
auto adjust_throttle(AdaptiveThrottling& throttling, double latency_ms,
                     const ThrottleConfig& config) -> double;

/// Accumulates latency, conflict and resolution statistics.
///
/// Not synchronized; owners serialize access (the engine guards its
/// monitor with a mutex, a canvas with its context lock).
class PerformanceMonitor {
public:
    explicit PerformanceMonitor(std::size_t window = 100);

    /// Record one completed transform.
    void record(double latency_ms, std::size_t conflicts = 0);

    /// Record the outcome of one conflict resolution.
    void record_resolution(bool resolved);

    /// Record one rejected operation.
    void record_rejection();

    /// Update the gauges reported alongside the counters.
    void set_gauges(double memory_usage_mb, std::size_t active_users, std::size_t queue_size);

    auto snapshot() const -> PerformanceMetrics;

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    std::size_t window_size_;
    std::deque<double> window_;
    double window_sum_{0.0};
    std::uint64_t operations_{0};
    std::uint64_t conflicts_{0};
    std::uint64_t resolved_{0};
    std::uint64_t handled_{0};
    std::uint64_t rejected_{0};
    double memory_usage_mb_{0.0};
    std::size_t active_users_{0};
    std::size_t queue_size_{0};
    Millis last_updated_{0};
    std::optional<Clock::time_point> first_record_{};
};

}  // namespace whiteboard_ot
