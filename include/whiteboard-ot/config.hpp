/// @file config.hpp
/// @brief Engine configuration with documented defaults.

#pragma once

#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/types.hpp>

#include <cstddef>
#include <map>
#include <string>

namespace whiteboard_ot {

/// Parameters of the adaptive throttle.
///
/// `initial_rate`, `min_rate` and `max_rate` are inter-operation delays in
/// microseconds: a higher rate asks callers to slow down.
struct ThrottleConfig {
    bool enabled{true};
    double initial_rate{1000.0};
    double min_rate{100.0};
    double max_rate{10000.0};
    double increase_factor{1.2};   ///< Applied when latency exceeds the target.
    double recovery_factor{0.9};   ///< Applied when latency is within the target.
    double target_latency_ms{500.0};

    auto operator==(const ThrottleConfig&) const -> bool = default;
};

/// Every tunable of the engine. Defaults match the reference behavior.
struct EngineConfig {
    // -- Detection ------------------------------------------------------------
    double spatial_proximity_threshold{50.0};
    Millis temporal_window_ms{1000};
    Millis simultaneous_window_ms{100};
    std::size_t severity_escalation_count{3};
    double grid_cell_size{100.0};
    std::size_t parallel_detection_threshold{512};

    // -- Resolution -----------------------------------------------------------
    double spatial_nudge{10.0};
    std::map<ConflictType, Strategy> strategy_overrides{};

    // -- Retention ------------------------------------------------------------
    std::size_t max_pending_operations{10000};
    std::size_t result_cache_size{5000};

    // -- Validation -----------------------------------------------------------
    Millis max_clock_skew_ms{60000};
    std::size_t max_payload_depth{8};
    std::size_t max_style_properties{50};
    double coordinate_limit{1000000.0};
    double max_extent{100000.0};

    // -- Monitoring -----------------------------------------------------------
    std::size_t latency_window{100};
    ThrottleConfig throttle{};

    auto operator==(const EngineConfig&) const -> bool = default;
};

/// Check every value for consistency.
/// @throws Error (invalid_config) naming the first offending field.
void validate(const EngineConfig& config);

/// Load and validate a configuration from a JSON file. Missing keys keep
/// their defaults.
/// @throws Error (invalid_config) when the file cannot be read or parsed.
auto load_config(const std::string& path) -> EngineConfig;

}  // namespace whiteboard_ot
