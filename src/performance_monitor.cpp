#include <whiteboard-ot/performance_monitor.hpp>

#include <algorithm>

namespace whiteboard_ot {

auto adjust_throttle(AdaptiveThrottling& throttling, double latency_ms,
                     const ThrottleConfig& config) -> double {
    if (!throttling.enabled) return throttling.current_rate;

    if (latency_ms > throttling.target_latency_ms) {
        throttling.current_rate =
            std::min(throttling.current_rate * config.increase_factor, config.max_rate);
    } else {
        throttling.current_rate =
            std::max(throttling.current_rate * config.recovery_factor, config.min_rate);
    }
    return throttling.current_rate;
}

PerformanceMonitor::PerformanceMonitor(std::size_t window)
    : window_size_{std::max<std::size_t>(window, 1)} {}

void PerformanceMonitor::record(double latency_ms, std::size_t conflicts) {
    const auto now = Clock::now();
    if (!first_record_) first_record_ = now;

    window_.push_back(latency_ms);
    window_sum_ += latency_ms;
    while (window_.size() > window_size_) {
        window_sum_ -= window_.front();
        window_.pop_front();
    }

    ++operations_;
    conflicts_ += conflicts;
    last_updated_ = now_millis();
}

void PerformanceMonitor::record_resolution(bool resolved) {
    ++handled_;
    if (resolved) ++resolved_;
    last_updated_ = now_millis();
}

void PerformanceMonitor::record_rejection() {
    ++rejected_;
    last_updated_ = now_millis();
}

void PerformanceMonitor::set_gauges(double memory_usage_mb, std::size_t active_users,
                                    std::size_t queue_size) {
    memory_usage_mb_ = memory_usage_mb;
    active_users_ = active_users;
    queue_size_ = queue_size;
}

auto PerformanceMonitor::snapshot() const -> PerformanceMetrics {
    auto m = PerformanceMetrics{};
    m.operation_count = operations_;
    m.conflict_count = conflicts_;
    m.rejected_count = rejected_;
    if (!window_.empty()) {
        m.average_latency_ms = window_sum_ / static_cast<double>(window_.size());
        m.max_latency_ms = *std::ranges::max_element(window_);
    }
    if (operations_ > 0) {
        m.conflict_rate = static_cast<double>(conflicts_) / static_cast<double>(operations_);
    }
    m.resolution_success_rate =
        handled_ > 0 ? static_cast<double>(resolved_) / static_cast<double>(handled_) : 1.0;
    if (first_record_) {
        const auto elapsed = std::chrono::duration<double>(Clock::now() - *first_record_).count();
        if (elapsed > 0.0) m.operation_throughput = static_cast<double>(operations_) / elapsed;
    }
    m.memory_usage_mb = memory_usage_mb_;
    m.active_users = active_users_;
    m.queue_size = queue_size_;
    m.last_updated = last_updated_;
    return m;
}

void PerformanceMonitor::reset() {
    *this = PerformanceMonitor{window_size_};
}

}  // namespace whiteboard_ot
