/// @file engine.hpp
/// @brief The operational transform engine.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/conflict_detector.hpp>
#include <whiteboard-ot/conflict_resolver.hpp>
#include <whiteboard-ot/context.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/performance_monitor.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace whiteboard_ot {

/// Transforms operations against a canvas context.
///
/// An Engine holds configuration, custom resolvers and engine-wide
/// metrics; all per-canvas state lives in a TransformContext. One engine
/// may serve many canvases concurrently, but each context must be used
/// by one thread at a time (Canvas provides the locking).
///
/// @code
/// auto engine = Engine{};
/// auto ctx = engine.create_context();
/// auto result = engine.transform(op, ctx);
/// for (const auto& c : result.conflicts) { ... }
/// @endcode
class Engine {
public:
    explicit Engine(EngineConfig config = {});

    Engine(const Engine&) = delete;
    auto operator=(const Engine&) -> Engine& = delete;

    auto config() const -> const EngineConfig& { return config_; }
    auto detector() const -> const ConflictDetector& { return detector_; }

    // -- Contexts -------------------------------------------------------------

    /// Build a full context from the minimal base state, filling in
    /// empty history, default throttling and a fresh monitor.
    auto create_context(BaseContext base = {}) const -> TransformContext;

    // -- Transform ------------------------------------------------------------

    /// Transform one operation against `ctx`.
    ///
    /// Validates, detects conflicts with `ctx.operation_queue` and
    /// `ctx.pending_operations`, resolves them, folds the outcomes into
    /// the returned operation, and commits it to the context. An id seen
    /// recently returns the earlier result without touching the context.
    ///
    /// @throws Error (missing_vector_clock, invalid_operation) for a
    ///   rejected operation; the rejection is still counted.
    /// @throws Error (empty_conflict) or a custom resolver's exception when
    ///   resolution fails; the failure is recorded in the history first.
    auto transform(const Operation& op, TransformContext& ctx,
                   const TransformOptions& options = {}) -> TransformResult;

    /// Transform a sequence atomically: if any operation is rejected the
    /// context is restored (failure records are kept) and the error
    /// propagates. Engine-wide metrics only count a sequence that commits,
    /// plus the rejection that aborted one.
    auto transform_all(const std::vector<Operation>& ops, TransformContext& ctx,
                       const TransformOptions& options = {}) -> std::vector<TransformResult>;

    // -- Transform phases (used by Canvas to narrow its write lock) ----------

    /// Validate and sanitize. Touches no context.
    /// @throws Error as transform() does for a rejected operation.
    auto prepare(const Operation& op) const -> Operation;

    /// Detect conflicts of a prepared operation. Reads `ctx` only.
    auto detect(const Operation& prepared, const TransformContext& ctx) const
        -> std::vector<ConflictInfo>;

    /// Resolve, fold and commit a prepared operation with its conflicts.
    auto commit(const Operation& prepared, std::vector<ConflictInfo> conflicts,
                TransformContext& ctx, const TransformOptions& options,
                std::chrono::steady_clock::time_point started) -> TransformResult;

    /// The cached result of a recently transformed id.
    auto redelivered(const Operation& op, TransformContext& ctx) const
        -> std::optional<TransformResult>;

    /// Count a rejected operation in the engine and context metrics.
    void record_rejection(TransformContext& ctx);

    // -- Manual conflicts -----------------------------------------------------

    /// Close an open conflict with a chosen outcome, applying it to the
    /// element states.
    /// @throws Error (unknown_conflict) when `conflict_id` is not open.
    auto resolve_conflict(TransformContext& ctx, std::string_view conflict_id,
                          const Operation& outcome) -> ConflictRecord;

    /// Close an open conflict without applying anything.
    /// @throws Error (unknown_conflict) when `conflict_id` is not open.
    auto abandon_conflict(TransformContext& ctx, std::string_view conflict_id) -> ConflictRecord;

    // -- Resolvers ------------------------------------------------------------

    /// Route every conflict of `type` to `resolver` unless a call names a
    /// strategy explicitly.
    void register_resolver(ConflictType type, std::shared_ptr<const ConflictResolver> resolver);
    void unregister_resolver(ConflictType type);

    // -- Utilities ------------------------------------------------------------

    auto compress(const std::vector<Operation>& ops) const -> std::vector<Operation>;

    /// Engine-wide metrics across every context.
    auto metrics() const -> PerformanceMetrics;

    /// Estimated retained memory of a context in megabytes.
    static auto estimate_memory_mb(const TransformContext& ctx) -> double;

private:
    /// Engine-wide statistics of one committed transform.
    struct Sample {
        double latency_ms{0.0};
        std::size_t conflicts{0};
        std::size_t resolved{0};
        double memory_usage_mb{0.0};
        std::size_t active_users{0};
        std::size_t queue_size{0};
    };

    /// Which resolver handles a conflict.
    struct Choice {
        std::string strategy;                            ///< Label recorded in the history.
        std::optional<Strategy> builtin{};
        std::shared_ptr<const ConflictResolver> custom{};
    };

    auto choose(const ConflictInfo& conflict, const TransformContext& ctx,
                const TransformOptions& options) const -> Choice;

    auto resolver_for(ConflictType type) const -> std::shared_ptr<const ConflictResolver>;

    /// transform() and commit() with the engine-wide samples collected in
    /// `deferred` instead of recorded, when it is non-null.
    auto transform_one(const Operation& op, TransformContext& ctx, const TransformOptions& options,
                       std::vector<Sample>* deferred) -> TransformResult;
    auto commit_one(const Operation& prepared, std::vector<ConflictInfo> conflicts,
                    TransformContext& ctx, const TransformOptions& options,
                    std::chrono::steady_clock::time_point started, std::vector<Sample>* deferred)
        -> TransformResult;

    void record_sample(const Sample& sample);

    EngineConfig config_;
    ConflictDetector detector_;

    mutable std::shared_mutex resolvers_mutex_;
    std::map<ConflictType, std::shared_ptr<const ConflictResolver>> resolvers_;

    mutable std::mutex monitor_mutex_;
    PerformanceMonitor monitor_;
};

}  // namespace whiteboard_ot
