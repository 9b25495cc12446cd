#include <whiteboard-ot/json.hpp>

#include <whiteboard-ot/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace whiteboard_ot {

using nlohmann::json;

// =============================================================================
// Helpers
// =============================================================================

namespace {

[[noreturn]] void malformed(const std::string& what) {
    throw Error{ErrorKind::decoding_error, what};
}

auto has(const json& j, const char* key) -> bool {
    auto it = j.find(key);
    return it != j.end() && !it->is_null();
}

auto required_string(const json& j, const char* key) -> std::string {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        malformed(std::string{"operation field '"} + key + "' must be a string");
    }
    return it->get<std::string>();
}

auto optional_string(const json& j, const char* key) -> std::optional<std::string> {
    if (!has(j, key)) return std::nullopt;
    return j.at(key).get<std::string>();
}

auto counter(const json& value, std::string_view field) -> std::uint64_t {
    if (value.is_number_unsigned()) return value.get<std::uint64_t>();
    if (value.is_number_integer() && value.get<std::int64_t>() >= 0) {
        return value.get<std::uint64_t>();
    }
    malformed(std::string{field} + " must be a non-negative integer");
}

auto counter_or(const json& j, const char* key, std::uint64_t fallback) -> std::uint64_t {
    return has(j, key) ? counter(j.at(key), key) : fallback;
}

// Copy `key` into `field` when present; absent keys keep the default.
template <typename T>
void read(const json& j, const char* key, T& field) {
    if (auto it = j.find(key); it != j.end()) it->get_to(field);
}

auto clock_to_json(const VectorClock& clock) -> json {
    auto j = json::object();
    for (const auto& [node, count] : clock) j[node] = count;
    return j;
}

auto clock_from_json(const json& j) -> VectorClock {
    if (!j.is_object()) malformed("vectorClock must be an object");
    auto clock = VectorClock{};
    for (auto it = j.begin(); it != j.end(); ++it) {
        clock.emplace(it.key(), counter(it.value(), "vectorClock." + it.key()));
    }
    return clock;
}

}  // namespace

// =============================================================================
// Geometry
// =============================================================================

void to_json(json& j, const Point& p) {
    j = json{{"x", p.x}, {"y", p.y}};
}

void from_json(const json& j, Point& p) {
    j.at("x").get_to(p.x);
    j.at("y").get_to(p.y);
}

void to_json(json& j, const Rect& r) {
    j = json{{"x", r.x}, {"y", r.y}, {"width", r.width}, {"height", r.height}};
}

void from_json(const json& j, Rect& r) {
    j.at("x").get_to(r.x);
    j.at("y").get_to(r.y);
    j.at("width").get_to(r.width);
    j.at("height").get_to(r.height);
}

// =============================================================================
// Enums
// =============================================================================

void to_json(json& j, OpType type) {
    j = std::string{to_string_view(type)};
}

void to_json(json& j, ConflictType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const json& j, ConflictType& type) {
    const auto name = j.get<std::string>();
    for (auto candidate : {ConflictType::spatial, ConflictType::temporal, ConflictType::semantic,
                           ConflictType::concurrent_modification}) {
        if (to_string_view(candidate) == name) {
            type = candidate;
            return;
        }
    }
    malformed("unknown conflict type '" + name + "'");
}

void to_json(json& j, Severity severity) {
    j = std::string{to_string_view(severity)};
}

void from_json(const json& j, Severity& severity) {
    const auto name = j.get<std::string>();
    for (auto candidate : {Severity::low, Severity::medium, Severity::high, Severity::critical}) {
        if (to_string_view(candidate) == name) {
            severity = candidate;
            return;
        }
    }
    malformed("unknown severity '" + name + "'");
}

void to_json(json& j, Strategy strategy) {
    j = std::string{to_string_view(strategy)};
}

void from_json(const json& j, Strategy& strategy) {
    const auto name = j.get<std::string>();
    auto parsed = parse_strategy(name);
    if (!parsed) malformed("unknown strategy '" + name + "'");
    strategy = *parsed;
}

void to_json(json& j, ConflictStatus status) {
    j = std::string{to_string_view(status)};
}

// =============================================================================
// Operations
// =============================================================================

void to_json(json& j, const Metadata& m) {
    j = m.extra.is_object() ? m.extra : json::object();
    if (m.client_id) j["clientId"] = *m.client_id;
    if (m.session_id) j["sessionId"] = *m.session_id;
}

void from_json(const json& j, Metadata& m) {
    m = Metadata{};
    if (!j.is_object()) malformed("metadata must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "clientId" && it->is_string()) {
            m.client_id = it->get<std::string>();
        } else if (it.key() == "sessionId" && it->is_string()) {
            m.session_id = it->get<std::string>();
        } else {
            m.extra[it.key()] = it.value();
        }
    }
}

void to_json(json& j, const Operation& op) {
    j = json{
        {"id", op.id},
        {"type", std::string{op.type_name()}},
        {"elementId", op.element_id},
        {"data", op.data},
        {"timestamp", op.timestamp},
        {"version", op.version},
        {"userId", op.user_id},
        {"lamportTimestamp", op.lamport_timestamp},
    };
    if (op.element_type) j["elementType"] = *op.element_type;
    if (op.position) j["position"] = *op.position;
    if (op.bounds) j["bounds"] = *op.bounds;
    if (op.style) j["style"] = *op.style;
    if (op.rotation) j["rotation"] = *op.rotation;
    if (op.z_index) j["zIndex"] = *op.z_index;
    if (op.vector_clock) j["vectorClock"] = clock_to_json(*op.vector_clock);
    if (!op.parent_operations.empty()) j["parentOperations"] = op.parent_operations;
    if (op.metadata != Metadata{}) j["metadata"] = op.metadata;
}

void from_json(const json& j, Operation& op) {
    if (!j.is_object()) malformed("operation must be a JSON object");

    op = Operation{};
    op.id = required_string(j, "id");
    const auto type = required_string(j, "type");
    op.type = parse_op_type(type);
    if (op.type == OpType::unknown) op.raw_type = type;

    if (op.type == OpType::batch && !j.contains("elementId")) {
        op.element_id.clear();
    } else {
        op.element_id = required_string(j, "elementId");
    }

    op.element_type = optional_string(j, "elementType");
    if (auto it = j.find("data"); it != j.end()) op.data = *it;
    if (has(j, "position")) op.position = j.at("position").get<Point>();
    if (has(j, "bounds")) op.bounds = j.at("bounds").get<Rect>();
    if (auto it = j.find("style"); it != j.end()) op.style = *it;
    if (has(j, "rotation")) op.rotation = j.at("rotation").get<double>();
    if (has(j, "zIndex")) op.z_index = j.at("zIndex").get<std::int64_t>();

    if (has(j, "timestamp")) op.timestamp = j.at("timestamp").get<Millis>();
    op.version = counter_or(j, "version", 0);
    if (has(j, "userId")) op.user_id = j.at("userId").get<std::string>();
    if (has(j, "vectorClock")) op.vector_clock = clock_from_json(j.at("vectorClock"));
    op.lamport_timestamp = counter_or(j, "lamportTimestamp", 0);

    if (has(j, "parentOperations")) {
        j.at("parentOperations").get_to(op.parent_operations);
    }
    if (has(j, "metadata")) op.metadata = j.at("metadata").get<Metadata>();
}

auto parse_operation(std::string_view text) -> Operation {
    try {
        return json::parse(text.begin(), text.end()).get<Operation>();
    } catch (const json::exception& e) {
        throw Error{ErrorKind::decoding_error, std::string{"malformed operation: "} + e.what()};
    }
}

// =============================================================================
// State and results
// =============================================================================

void to_json(json& j, const ElementState& s) {
    j = json{
        {"elementId", s.element_id},
        {"data", s.data},
        {"style", s.style},
        {"deleted", s.deleted},
        {"lastOperationId", s.last_operation_id},
        {"lastUserId", s.last_user_id},
        {"lastTimestamp", s.last_timestamp},
        {"version", s.version},
        {"lamportTimestamp", s.lamport_timestamp},
    };
    if (s.element_type) j["elementType"] = *s.element_type;
    if (s.position) j["position"] = *s.position;
    if (s.bounds) j["bounds"] = *s.bounds;
    if (s.rotation) j["rotation"] = *s.rotation;
    if (s.z_index) j["zIndex"] = *s.z_index;
}

void from_json(const json& j, ElementState& s) {
    s = ElementState{};
    j.at("elementId").get_to(s.element_id);
    s.element_type = optional_string(j, "elementType");
    read(j, "data", s.data);
    read(j, "style", s.style);
    if (has(j, "position")) s.position = j.at("position").get<Point>();
    if (has(j, "bounds")) s.bounds = j.at("bounds").get<Rect>();
    if (has(j, "rotation")) s.rotation = j.at("rotation").get<double>();
    if (has(j, "zIndex")) s.z_index = j.at("zIndex").get<std::int64_t>();
    read(j, "deleted", s.deleted);
    read(j, "lastOperationId", s.last_operation_id);
    read(j, "lastUserId", s.last_user_id);
    read(j, "lastTimestamp", s.last_timestamp);
    s.version = counter_or(j, "version", 0);
    s.lamport_timestamp = counter_or(j, "lamportTimestamp", 0);
}

void to_json(json& j, const ConflictInfo& c) {
    j = json{
        {"id", c.id},
        {"type", c.type},
        {"severity", c.severity},
        {"operations", c.operations},
        {"detectedAt", c.detected_at},
        {"affectedElements", c.affected_elements},
        {"vectorClockDivergence", c.vector_clock_divergence},
    };
    if (c.spatial_overlap) {
        j["spatialOverlap"] = json{{"area", c.spatial_overlap->area},
                                   {"percentage", c.spatial_overlap->percentage},
                                   {"distance", c.spatial_overlap->distance}};
    }
    if (c.temporal_proximity) {
        j["temporalProximity"] = json{{"timeDiffMs", c.temporal_proximity->time_diff_ms},
                                      {"simultaneous", c.temporal_proximity->simultaneous}};
    }
    if (c.semantic) {
        j["semantic"] = json{{"incompatibleChanges", c.semantic->incompatible_changes},
                             {"dataConflicts", c.semantic->data_conflicts}};
    }
}

void to_json(json& j, const ConflictRecord& r) {
    j = json{
        {"conflict", r.conflict},
        {"strategy", r.strategy},
        {"resolver", r.resolver},
        {"status", r.status},
        {"recordedAt", r.recorded_at},
        {"resolutionTimeMs", r.resolution_time_ms},
        {"confidence", r.confidence},
    };
    j["outcomeOperationId"] = r.outcome_operation_id ? json(*r.outcome_operation_id) : json();
}

void to_json(json& j, const PerformanceMetrics& m) {
    j = json{
        {"operationCount", m.operation_count},
        {"averageLatencyMs", m.average_latency_ms},
        {"maxLatencyMs", m.max_latency_ms},
        {"conflictRate", m.conflict_rate},
        {"resolutionSuccessRate", m.resolution_success_rate},
        {"operationThroughput", m.operation_throughput},
        {"memoryUsageMb", m.memory_usage_mb},
        {"activeUsers", m.active_users},
        {"queueSize", m.queue_size},
        {"lastUpdated", m.last_updated},
        {"rejectedCount", m.rejected_count},
        {"conflictCount", m.conflict_count},
    };
}

void to_json(json& j, const AdaptiveThrottling& t) {
    j = json{{"enabled", t.enabled},
             {"currentRate", t.current_rate},
             {"targetLatencyMs", t.target_latency_ms}};
}

void to_json(json& j, const TransformResult& r) {
    j = json{
        {"transformedOperation", r.transformed_operation},
        {"conflicts", r.conflicts},
        {"performance", json{{"processingTimeMs", r.performance.processing_time_ms},
                             {"memoryUsageMb", r.performance.memory_usage_mb},
                             {"queueSize", r.performance.queue_size}}},
        {"redelivered", r.redelivered},
    };
}

// =============================================================================
// Configuration
// =============================================================================

void to_json(json& j, const ThrottleConfig& c) {
    j = json{
        {"enabled", c.enabled},
        {"initialRate", c.initial_rate},
        {"minRate", c.min_rate},
        {"maxRate", c.max_rate},
        {"increaseFactor", c.increase_factor},
        {"recoveryFactor", c.recovery_factor},
        {"targetLatencyMs", c.target_latency_ms},
    };
}

void from_json(const json& j, ThrottleConfig& c) {
    read(j, "enabled", c.enabled);
    read(j, "initialRate", c.initial_rate);
    read(j, "minRate", c.min_rate);
    read(j, "maxRate", c.max_rate);
    read(j, "increaseFactor", c.increase_factor);
    read(j, "recoveryFactor", c.recovery_factor);
    read(j, "targetLatencyMs", c.target_latency_ms);
}

void to_json(json& j, const EngineConfig& c) {
    auto overrides = json::object();
    for (const auto& [type, strategy] : c.strategy_overrides) {
        overrides[std::string{to_string_view(type)}] = strategy;
    }
    j = json{
        {"spatialProximityThreshold", c.spatial_proximity_threshold},
        {"temporalWindowMs", c.temporal_window_ms},
        {"simultaneousWindowMs", c.simultaneous_window_ms},
        {"severityEscalationCount", c.severity_escalation_count},
        {"gridCellSize", c.grid_cell_size},
        {"parallelDetectionThreshold", c.parallel_detection_threshold},
        {"spatialNudge", c.spatial_nudge},
        {"strategyOverrides", std::move(overrides)},
        {"maxPendingOperations", c.max_pending_operations},
        {"resultCacheSize", c.result_cache_size},
        {"maxClockSkewMs", c.max_clock_skew_ms},
        {"maxPayloadDepth", c.max_payload_depth},
        {"maxStyleProperties", c.max_style_properties},
        {"coordinateLimit", c.coordinate_limit},
        {"maxExtent", c.max_extent},
        {"latencyWindow", c.latency_window},
        {"throttle", c.throttle},
    };
}

void from_json(const json& j, EngineConfig& c) {
    if (!j.is_object()) malformed("engine configuration must be a JSON object");
    read(j, "spatialProximityThreshold", c.spatial_proximity_threshold);
    read(j, "temporalWindowMs", c.temporal_window_ms);
    read(j, "simultaneousWindowMs", c.simultaneous_window_ms);
    read(j, "severityEscalationCount", c.severity_escalation_count);
    read(j, "gridCellSize", c.grid_cell_size);
    read(j, "parallelDetectionThreshold", c.parallel_detection_threshold);
    read(j, "spatialNudge", c.spatial_nudge);
    if (auto it = j.find("strategyOverrides"); it != j.end()) {
        if (!it->is_object()) malformed("strategyOverrides must be an object");
        c.strategy_overrides.clear();
        for (auto entry = it->begin(); entry != it->end(); ++entry) {
            auto type = json(entry.key()).get<ConflictType>();
            c.strategy_overrides[type] = entry.value().get<Strategy>();
        }
    }
    read(j, "maxPendingOperations", c.max_pending_operations);
    read(j, "resultCacheSize", c.result_cache_size);
    read(j, "maxClockSkewMs", c.max_clock_skew_ms);
    read(j, "maxPayloadDepth", c.max_payload_depth);
    read(j, "maxStyleProperties", c.max_style_properties);
    read(j, "coordinateLimit", c.coordinate_limit);
    read(j, "maxExtent", c.max_extent);
    read(j, "latencyWindow", c.latency_window);
    read(j, "throttle", c.throttle);
}

}  // namespace whiteboard_ot
