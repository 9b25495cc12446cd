#include <whiteboard-ot/config.hpp>

#include <whiteboard-ot/error.hpp>
#include <whiteboard-ot/json.hpp>

#include <glog/logging.h>

#include <cmath>
#include <fstream>
#include <string>

namespace whiteboard_ot {

namespace {

[[noreturn]] void invalid(const std::string& field, const std::string& requirement) {
    throw Error{ErrorKind::invalid_config, field + " " + requirement};
}

void require_positive(double value, const char* field) {
    if (!std::isfinite(value) || value <= 0.0) invalid(field, "must be a positive number");
}

void require_non_negative(double value, const char* field) {
    if (!std::isfinite(value) || value < 0.0) invalid(field, "must be a non-negative number");
}

void require_at_least_one(std::size_t value, const char* field) {
    if (value == 0) invalid(field, "must be at least 1");
}

}  // namespace

void validate(const EngineConfig& config) {
    require_non_negative(config.spatial_proximity_threshold, "spatial_proximity_threshold");
    if (config.temporal_window_ms <= 0) invalid("temporal_window_ms", "must be positive");
    if (config.simultaneous_window_ms < 0 ||
        config.simultaneous_window_ms > config.temporal_window_ms) {
        invalid("simultaneous_window_ms", "must lie between 0 and temporal_window_ms");
    }
    require_at_least_one(config.severity_escalation_count, "severity_escalation_count");
    require_positive(config.grid_cell_size, "grid_cell_size");
    require_at_least_one(config.parallel_detection_threshold, "parallel_detection_threshold");
    require_non_negative(config.spatial_nudge, "spatial_nudge");

    require_at_least_one(config.max_pending_operations, "max_pending_operations");
    if (config.max_clock_skew_ms < 0) invalid("max_clock_skew_ms", "must not be negative");
    require_at_least_one(config.max_payload_depth, "max_payload_depth");
    require_at_least_one(config.max_style_properties, "max_style_properties");
    require_positive(config.coordinate_limit, "coordinate_limit");
    require_positive(config.max_extent, "max_extent");
    require_at_least_one(config.latency_window, "latency_window");

    const auto& t = config.throttle;
    require_positive(t.min_rate, "throttle.min_rate");
    require_positive(t.max_rate, "throttle.max_rate");
    if (t.min_rate > t.max_rate) invalid("throttle.min_rate", "must not exceed throttle.max_rate");
    if (!std::isfinite(t.initial_rate) || t.initial_rate < t.min_rate ||
        t.initial_rate > t.max_rate) {
        invalid("throttle.initial_rate", "must lie between min_rate and max_rate");
    }
    if (!std::isfinite(t.increase_factor) || t.increase_factor < 1.0) {
        invalid("throttle.increase_factor", "must be at least 1");
    }
    if (!std::isfinite(t.recovery_factor) || t.recovery_factor <= 0.0 || t.recovery_factor > 1.0) {
        invalid("throttle.recovery_factor", "must lie in (0, 1]");
    }
    require_positive(t.target_latency_ms, "throttle.target_latency_ms");
}

auto load_config(const std::string& path) -> EngineConfig {
    auto in = std::ifstream{path};
    if (!in) {
        throw Error{ErrorKind::invalid_config, "cannot open config file " + path};
    }

    auto config = EngineConfig{};
    try {
        from_json(nlohmann::json::parse(in), config);
    } catch (const nlohmann::json::exception& e) {
        throw Error{ErrorKind::invalid_config, "config file " + path + ": " + e.what()};
    } catch (const Error& e) {
        throw Error{ErrorKind::invalid_config, "config file " + path + ": " + e.message};
    }
    validate(config);
    LOG(INFO) << "loaded engine configuration from " << path;
    return config;
}

}  // namespace whiteboard_ot
