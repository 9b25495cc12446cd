/// @file context.hpp
/// @brief Per-canvas transform state and the transform result.

#pragma once

#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/conflict_resolver.hpp>
#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/lru_cache.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/operation_index.hpp>
#include <whiteboard-ot/performance_monitor.hpp>
#include <whiteboard-ot/vector_clock.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace whiteboard_ot {

/// Timing and footprint of one transform.
struct TransformPerformance {
    double processing_time_ms{0.0};
    double memory_usage_mb{0.0};
    std::size_t queue_size{0};

    auto operator==(const TransformPerformance&) const -> bool = default;
};

/// What Engine::transform returns.
struct TransformResult {
    Operation transformed_operation;
    std::vector<ConflictInfo> conflicts;
    TransformPerformance performance{};
    bool redelivered{false};  ///< Served from the result cache; state untouched.

    auto operator==(const TransformResult&) const -> bool = default;
};

/// Per-call overrides.
struct TransformOptions {
    /// Resolve every conflict with this strategy instead of the
    /// registered or default one.
    std::optional<Strategy> strategy{};
};

/// The minimal state a canvas session starts from.
struct BaseContext {
    std::uint64_t canvas_version{0};
    std::vector<Operation> pending_operations{};
    ElementStates element_states{};
    VectorClock current_vector_clock{};
    std::uint64_t lamport_clock{0};
};

/// Mutable working state for one canvas.
///
/// Built by Engine::create_context(). Not synchronized: use Canvas for
/// shared access, or serialize calls yourself.
struct TransformContext {
    std::uint64_t canvas_version{0};
    OperationIndex pending_operations{};
    ElementStates element_states{};
    VectorClock current_vector_clock{};
    LamportClock lamport_clock{};
    OperationIndex operation_queue{};
    std::vector<ConflictRecord> conflict_history{};  ///< Append-only.
    std::map<std::string, ConflictInfo, std::less<>> active_conflicts{};
    UserPriorities user_priorities{};
    bool compression_enabled{true};
    bool batching_enabled{true};
    AdaptiveThrottling adaptive_throttling{};
    PerformanceMetrics performance_metrics{};

    /// Incremented on every mutation; lets a caller detect that state
    /// moved between an unlocked read and a locked commit.
    std::uint64_t generation{0};

    /// Recently transformed operations by id, for idempotent redelivery.
    LruCache<std::string, TransformResult> recent_results{};

    PerformanceMonitor monitor{};
};

}  // namespace whiteboard_ot
