#include <whiteboard-ot/canvas.hpp>

#include <whiteboard-ot/compressor.hpp>
#include <whiteboard-ot/error.hpp>

#include <glog/logging.h>

#include <cmath>
#include <utility>

namespace whiteboard_ot {

Canvas::Canvas(EngineConfig config)
    : engine_{std::make_shared<Engine>(std::move(config))}, ctx_{engine_->create_context()} {}

Canvas::Canvas(std::shared_ptr<Engine> engine, BaseContext base)
    : engine_{engine ? std::move(engine) : std::make_shared<Engine>()},
      ctx_{engine_->create_context(std::move(base))} {}

// -- Mutation -------------------------------------------------------------------

auto Canvas::transform(const Operation& op, const TransformOptions& options) -> TransformResult {
    const auto started = std::chrono::steady_clock::now();

    auto prepared = Operation{};
    try {
        prepared = engine_->prepare(op);
    } catch (const Error& e) {
        LOG(WARNING) << "rejected operation " << op.id << ": " << e.what();
        auto lock = std::unique_lock{mutex_};
        engine_->record_rejection(ctx_);
        throw;
    }

    // Detect under the shared lock so readers and other detectors proceed.
    auto conflicts = std::vector<ConflictInfo>{};
    auto generation = std::uint64_t{0};
    {
        auto lock = std::shared_lock{mutex_};
        if (!ctx_.recent_results.contains(prepared.id)) {
            conflicts = engine_->detect(prepared, ctx_);
        }
        generation = ctx_.generation;
    }

    auto lock = std::unique_lock{mutex_};
    if (auto cached = engine_->redelivered(prepared, ctx_)) return *cached;
    if (ctx_.generation != generation) {
        VLOG(2) << "canvas moved while detecting conflicts of " << prepared.id
                << ", detecting again";
        conflicts = engine_->detect(prepared, ctx_);
    }
    return engine_->commit(prepared, std::move(conflicts), ctx_, options, started);
}

auto Canvas::transact(const std::function<void(Transaction&)>& fn) -> std::vector<TransformResult> {
    auto tx = Transaction{};
    fn(tx);
    if (tx.ops_.empty()) return {};

    auto lock = std::unique_lock{mutex_};
    return engine_->transform_all(tx.ops_, ctx_);
}

void Canvas::enqueue(const Operation& op) {
    auto prepared = Operation{};
    try {
        prepared = engine_->prepare(op);
    } catch (const Error& e) {
        LOG(WARNING) << "rejected queued operation " << op.id << ": " << e.what();
        auto lock = std::unique_lock{mutex_};
        engine_->record_rejection(ctx_);
        throw;
    }
    auto lock = std::unique_lock{mutex_};
    ctx_.operation_queue.insert(prepared);
    ++ctx_.generation;
}

auto Canvas::acknowledge(std::string_view operation_id) -> bool {
    auto lock = std::unique_lock{mutex_};
    const auto queued = ctx_.operation_queue.erase(operation_id);
    const auto pending = ctx_.pending_operations.erase(operation_id);
    if (queued || pending) ++ctx_.generation;
    return queued || pending;
}

auto Canvas::drain_pending() -> std::vector<Operation> {
    auto lock = std::unique_lock{mutex_};
    auto ops = ctx_.pending_operations.operations();
    ctx_.pending_operations.clear();
    ++ctx_.generation;
    if (!ctx_.compression_enabled) return ops;

    auto compressed = compress(ops);
    VLOG(1) << "drained " << ops.size() << " pending operations as " << compressed.size();
    return compressed;
}

auto Canvas::resolve_conflict(std::string_view conflict_id, const Operation& outcome)
    -> ConflictRecord {
    auto lock = std::unique_lock{mutex_};
    return engine_->resolve_conflict(ctx_, conflict_id, outcome);
}

auto Canvas::abandon_conflict(std::string_view conflict_id) -> ConflictRecord {
    auto lock = std::unique_lock{mutex_};
    return engine_->abandon_conflict(ctx_, conflict_id);
}

void Canvas::set_user_priority(std::string user_id, double weight) {
    auto lock = std::unique_lock{mutex_};
    ctx_.user_priorities.insert_or_assign(std::move(user_id), weight);
}

void Canvas::set_compression_enabled(bool enabled) {
    auto lock = std::unique_lock{mutex_};
    ctx_.compression_enabled = enabled;
}

// -- Reading ----------------------------------------------------------------------

auto Canvas::element_state(std::string_view element_id) const -> std::optional<ElementState> {
    auto lock = std::shared_lock{mutex_};
    auto it = ctx_.element_states.find(std::string{element_id});
    if (it == ctx_.element_states.end()) return std::nullopt;
    return it->second;
}

auto Canvas::snapshot() const -> ElementStates {
    auto lock = std::shared_lock{mutex_};
    return ctx_.element_states;
}

auto Canvas::metrics() const -> PerformanceMetrics {
    auto lock = std::shared_lock{mutex_};
    return ctx_.performance_metrics;
}

auto Canvas::active_conflicts() const -> std::vector<ConflictInfo> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<ConflictInfo>{};
    result.reserve(ctx_.active_conflicts.size());
    for (const auto& [id, conflict] : ctx_.active_conflicts) result.push_back(conflict);
    return result;
}

auto Canvas::conflict_history() const -> std::vector<ConflictRecord> {
    auto lock = std::shared_lock{mutex_};
    return ctx_.conflict_history;
}

auto Canvas::canvas_version() const -> std::uint64_t {
    auto lock = std::shared_lock{mutex_};
    return ctx_.canvas_version;
}

auto Canvas::vector_clock() const -> VectorClock {
    auto lock = std::shared_lock{mutex_};
    return ctx_.current_vector_clock;
}

auto Canvas::pending_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return ctx_.pending_operations.size();
}

auto Canvas::queue_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return ctx_.operation_queue.size();
}

auto Canvas::suggested_delay() const -> std::chrono::microseconds {
    auto lock = std::shared_lock{mutex_};
    return std::chrono::microseconds{std::llround(ctx_.adaptive_throttling.current_rate)};
}

}  // namespace whiteboard_ot
