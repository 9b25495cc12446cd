/// @file canvas.hpp
/// @brief Thread-safe owner of one canvas's transform context.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/context.hpp>
#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/engine.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/performance_monitor.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace whiteboard_ot {

class Canvas;

/// Collects operations to be transformed together by Canvas::transact().
///
/// @code
/// canvas.transact([&](Transaction& tx) {
///     tx.add(create_op);
///     tx.add(style_op);
/// });
/// @endcode
class Transaction {
    friend class Canvas;
    Transaction() = default;

public:
    /// Queue an operation. Nothing touches the canvas until the
    /// transaction function returns.
    void add(Operation op) { ops_.push_back(std::move(op)); }

    auto size() const -> std::size_t { return ops_.size(); }
    auto operations() const -> const std::vector<Operation>& { return ops_; }

private:
    std::vector<Operation> ops_;
};

/// One whiteboard canvas shared by many concurrent callers.
///
/// Validation runs without the lock, detection under a shared lock, and
/// resolution plus commit under the exclusive lock. If another writer
/// committed in between, detection is repeated under the exclusive lock,
/// so no caller ever observes a partially applied operation.
class Canvas {
public:
    /// A canvas with its own engine.
    explicit Canvas(EngineConfig config = {});

    /// A canvas sharing `engine` with other canvases.
    explicit Canvas(std::shared_ptr<Engine> engine, BaseContext base = {});

    Canvas(const Canvas&) = delete;
    auto operator=(const Canvas&) -> Canvas& = delete;

    // -- Mutation -------------------------------------------------------------

    auto transform(const Operation& op, const TransformOptions& options = {}) -> TransformResult;

    /// Transform every operation added in `fn` atomically.
    ///
    /// If `fn` throws nothing is applied. If any operation is rejected the
    /// canvas is restored and the error propagates.
    auto transact(const std::function<void(Transaction&)>& fn) -> std::vector<TransformResult>;

    /// Add a validated operation to the outstanding queue that incoming
    /// operations are checked against.
    void enqueue(const Operation& op);

    /// Forget an operation once every client has seen it.
    /// @return false when the id was neither queued nor pending.
    auto acknowledge(std::string_view operation_id) -> bool;

    /// Remove and return every pending operation, compressed when
    /// compression is enabled.
    auto drain_pending() -> std::vector<Operation>;

    auto resolve_conflict(std::string_view conflict_id, const Operation& outcome) -> ConflictRecord;
    auto abandon_conflict(std::string_view conflict_id) -> ConflictRecord;

    void set_user_priority(std::string user_id, double weight);
    void set_compression_enabled(bool enabled);

    // -- Reading --------------------------------------------------------------

    auto element_state(std::string_view element_id) const -> std::optional<ElementState>;
    auto snapshot() const -> ElementStates;
    auto metrics() const -> PerformanceMetrics;
    auto active_conflicts() const -> std::vector<ConflictInfo>;
    auto conflict_history() const -> std::vector<ConflictRecord>;
    auto canvas_version() const -> std::uint64_t;
    auto vector_clock() const -> VectorClock;
    auto pending_count() const -> std::size_t;
    auto queue_count() const -> std::size_t;

    /// The throttle's current suggested delay between operations.
    auto suggested_delay() const -> std::chrono::microseconds;

    /// Run `fn` with read access to the whole context.
    template <typename Fn>
        requires std::invocable<Fn, const TransformContext&>
    auto read(Fn&& fn) const -> std::invoke_result_t<Fn, const TransformContext&> {
        auto lock = std::shared_lock{mutex_};
        return fn(ctx_);
    }

    auto engine() const -> Engine& { return *engine_; }

private:
    std::shared_ptr<Engine> engine_;
    TransformContext ctx_;
    mutable std::shared_mutex mutex_;
};

}  // namespace whiteboard_ot
