#include <whiteboard-ot/engine.hpp>

#include <whiteboard-ot/compressor.hpp>
#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/error.hpp>

#include "validation.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace whiteboard_ot {

namespace {

using SteadyClock = std::chrono::steady_clock;

auto elapsed_ms(SteadyClock::time_point since) -> double {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - since).count();
}

auto same_fields(const Operation& a, const Operation& b) -> bool {
    return a.data == b.data && a.style == b.style && a.position == b.position &&
           a.bounds == b.bounds && a.rotation == b.rotation && a.z_index == b.z_index;
}

// Compound, batch and unknown results keep their payload as submitted.
auto foldable(OpType type) -> bool {
    return type != OpType::compound && type != OpType::batch && type != OpType::unknown;
}

// Give `winner`'s value to every key both objects carry.
void override_shared_keys(nlohmann::json& target, const nlohmann::json& winner) {
    if (!target.is_object() || !winner.is_object()) return;
    for (auto it = target.begin(); it != target.end(); ++it) {
        if (auto w = winner.find(it.key()); w != winner.end()) *it = *w;
    }
}

struct FoldState {
    bool nudged{false};
};

// Fold one resolution outcome into the operation being transformed.
// The transformed operation always keeps its own identity.
void fold_outcome(Operation& transformed, const Operation& original, const ConflictInfo& conflict,
                  const Operation& outcome, const EngineConfig& config, FoldState& state) {
    // A delete is never undone by another operation's outcome.
    if (transformed.type == OpType::del) return;

    if (outcome.element_id != transformed.element_id) {
        // Lost to an operation on a neighbouring element: step a moved
        // element aside so the two stay distinguishable.
        if (conflict.type == ConflictType::spatial && outcome.id != original.id &&
            transformed.type == OpType::move && transformed.position && !state.nudged) {
            transformed.position->x += config.spatial_nudge;
            transformed.position->y += config.spatial_nudge;
            if (transformed.bounds) {
                transformed.bounds->x += config.spatial_nudge;
                transformed.bounds->y += config.spatial_nudge;
            }
            state.nudged = true;
        }
        return;
    }

    if (outcome.id == original.id) {
        // Won; a merged outcome also carries the others' fields.
        if (outcome.type == transformed.type && !same_fields(outcome, original)) {
            transformed.data = outcome.data;
            transformed.style = outcome.style;
            transformed.position = outcome.position;
            transformed.bounds = outcome.bounds;
            transformed.rotation = outcome.rotation;
            transformed.z_index = outcome.z_index;
        }
        return;
    }

    if (outcome.type == OpType::del) {
        transformed.type = OpType::del;
        transformed.data = nullptr;
        transformed.position.reset();
        transformed.bounds.reset();
        transformed.style.reset();
        transformed.rotation.reset();
        transformed.z_index.reset();
        return;
    }

    override_shared_keys(transformed.data, outcome.data);
    if (transformed.style && outcome.style) override_shared_keys(*transformed.style, *outcome.style);
    if (transformed.position && outcome.position) transformed.position = outcome.position;
    if (transformed.bounds && outcome.bounds) transformed.bounds = outcome.bounds;
    if (transformed.rotation && outcome.rotation) transformed.rotation = outcome.rotation;
    if (transformed.z_index && outcome.z_index) transformed.z_index = outcome.z_index;
}

// A conflict concerns the parts sharing the id and element of its first
// operation: every part of a compound, or one nested batch entry.
auto concerns(const ConflictInfo& conflict, const Operation& part) -> bool {
    if (conflict.operations.empty()) return false;
    const auto& own = conflict.operations.front();
    return own.id == part.id && own.element_id == part.element_id;
}

auto is_rejection(ErrorKind kind) -> bool {
    return kind == ErrorKind::invalid_operation || kind == ErrorKind::missing_vector_clock;
}

}  // namespace

Engine::Engine(EngineConfig config)
    : config_{std::move(config)}, detector_{config_}, monitor_{config_.latency_window} {
    validate(config_);
}

// -- Contexts -----------------------------------------------------------------

auto Engine::create_context(BaseContext base) const -> TransformContext {
    auto ctx = TransformContext{};
    ctx.canvas_version = base.canvas_version;
    ctx.pending_operations = OperationIndex{config_.grid_cell_size};
    ctx.operation_queue = OperationIndex{config_.grid_cell_size};

    auto lamport = base.lamport_clock;
    for (const auto& op : base.pending_operations) {
        ctx.pending_operations.insert(op);
        lamport = std::max(lamport, op.lamport_timestamp);
    }
    ctx.element_states = std::move(base.element_states);
    ctx.current_vector_clock = std::move(base.current_vector_clock);
    ctx.lamport_clock = LamportClock{lamport};

    ctx.adaptive_throttling = AdaptiveThrottling{
        .enabled = config_.throttle.enabled,
        .current_rate = config_.throttle.initial_rate,
        .target_latency_ms = config_.throttle.target_latency_ms,
    };
    ctx.recent_results = LruCache<std::string, TransformResult>{config_.result_cache_size};
    ctx.monitor = PerformanceMonitor{config_.latency_window};
    ctx.performance_metrics = ctx.monitor.snapshot();
    return ctx;
}

// -- Transform ----------------------------------------------------------------

auto Engine::prepare(const Operation& op) const -> Operation {
    return detail::validate_operation(op, config_);
}

auto Engine::detect(const Operation& prepared, const TransformContext& ctx) const
    -> std::vector<ConflictInfo> {
    return detector_.detect(prepared, {&ctx.operation_queue, &ctx.pending_operations});
}

auto Engine::redelivered(const Operation& op, TransformContext& ctx) const
    -> std::optional<TransformResult> {
    const auto* hit = ctx.recent_results.get(op.id);
    if (hit == nullptr) return std::nullopt;
    VLOG(1) << "operation " << op.id << " redelivered, returning the earlier result";
    auto result = *hit;
    result.redelivered = true;
    return result;
}

void Engine::record_rejection(TransformContext& ctx) {
    ctx.monitor.record_rejection();
    ctx.performance_metrics = ctx.monitor.snapshot();
    auto lock = std::lock_guard{monitor_mutex_};
    monitor_.record_rejection();
}

auto Engine::transform(const Operation& op, TransformContext& ctx,
                       const TransformOptions& options) -> TransformResult {
    return transform_one(op, ctx, options, nullptr);
}

auto Engine::transform_one(const Operation& op, TransformContext& ctx,
                           const TransformOptions& options, std::vector<Sample>* deferred)
    -> TransformResult {
    const auto started = SteadyClock::now();

    auto prepared = Operation{};
    try {
        prepared = prepare(op);
    } catch (const Error& e) {
        LOG(WARNING) << "rejected operation " << op.id << ": " << e.what();
        record_rejection(ctx);
        throw;
    }

    if (auto cached = redelivered(prepared, ctx)) return *cached;
    return commit_one(prepared, detect(prepared, ctx), ctx, options, started, deferred);
}

auto Engine::choose(const ConflictInfo& conflict, const TransformContext& ctx,
                    const TransformOptions& options) const -> Choice {
    if (options.strategy) {
        return Choice{std::string{to_string_view(*options.strategy)}, options.strategy, nullptr};
    }
    if (auto custom = resolver_for(conflict.type)) {
        return Choice{"custom", std::nullopt, std::move(custom)};
    }
    const auto strategy = default_strategy(conflict, ctx.user_priorities, config_);
    return Choice{std::string{to_string_view(strategy)}, strategy, nullptr};
}

auto Engine::commit(const Operation& prepared, std::vector<ConflictInfo> conflicts,
                    TransformContext& ctx, const TransformOptions& options,
                    SteadyClock::time_point started) -> TransformResult {
    return commit_one(prepared, std::move(conflicts), ctx, options, started, nullptr);
}

auto Engine::commit_one(const Operation& prepared, std::vector<ConflictInfo> conflicts,
                        TransformContext& ctx, const TransformOptions& options,
                        SteadyClock::time_point started, std::vector<Sample>* deferred)
    -> TransformResult {
    if (prepared.type == OpType::unknown) {
        LOG(WARNING) << "operation " << prepared.id << " has unknown type '" << prepared.raw_type
                     << "', passing it through unchanged";
    }

    // The incoming operation is resolved on the canvas Lamport scale, like
    // the committed operations it is compared with.
    auto stamped = prepared;
    stamped.lamport_timestamp = std::max(ctx.lamport_clock.value(), prepared.lamport_timestamp) + 1;
    for (auto& conflict : conflicts) {
        if (!conflict.operations.empty()) {
            conflict.operations.front().lamport_timestamp = stamped.lamport_timestamp;
        }
    }

    // -- Resolve every conflict before touching the context ------------------

    struct Decided {
        Choice choice;
        Resolution resolution;
        double time_ms;
    };
    auto decided = std::vector<Decided>{};
    decided.reserve(conflicts.size());

    for (const auto& conflict : conflicts) {
        const auto resolve_started = SteadyClock::now();
        auto choice = choose(conflict, ctx, options);
        try {
            auto resolution = choice.custom
                                  ? choice.custom->resolve(conflict, ctx.user_priorities)
                                  : resolve(*choice.builtin, conflict, ctx.user_priorities);
            resolution.confidence = std::clamp(resolution.confidence, 0.0, 1.0);
            decided.push_back(Decided{std::move(choice), std::move(resolution),
                                      elapsed_ms(resolve_started)});
        } catch (const std::exception& e) {
            LOG(ERROR) << "resolving conflict " << conflict.id << " with " << choice.strategy
                       << " failed: " << e.what();
            ctx.conflict_history.push_back(ConflictRecord{
                .conflict = conflict,
                .strategy = choice.strategy,
                .resolver = choice.custom ? std::string{choice.custom->name()} : choice.strategy,
                .status = ConflictStatus::failed,
                .recorded_at = now_millis(),
                .resolution_time_ms = elapsed_ms(resolve_started),
            });
            ++ctx.generation;
            ctx.monitor.record_resolution(false);
            ctx.performance_metrics = ctx.monitor.snapshot();
            if (deferred == nullptr) {
                auto lock = std::lock_guard{monitor_mutex_};
                monitor_.record_resolution(false);
            }
            throw;
        }
    }

    // -- Fold the outcomes ----------------------------------------------------

    // Compound and batch operations keep their shape; the outcomes are
    // folded into the parts that reach the element states.
    auto transformed = stamped;
    const auto whole = foldable(prepared.type);
    auto parts = std::vector<Operation>{};
    if (!whole && prepared.type != OpType::unknown) parts = expand_operation(stamped);
    const auto originals = parts;
    auto fold_states = std::vector<FoldState>(parts.size());

    auto fold_state = FoldState{};
    auto held = false;
    for (std::size_t i = 0; i < conflicts.size(); ++i) {
        const auto& outcome = decided[i].resolution.outcome;
        if (!outcome) {
            held = true;
            continue;
        }
        if (whole) {
            fold_outcome(transformed, stamped, conflicts[i], *outcome, config_, fold_state);
            continue;
        }
        for (std::size_t p = 0; p < parts.size(); ++p) {
            if (concerns(conflicts[i], originals[p])) {
                fold_outcome(parts[p], originals[p], conflicts[i], *outcome, config_,
                             fold_states[p]);
            }
        }
    }

    // -- Commit ---------------------------------------------------------------

    ctx.lamport_clock.receive(prepared.lamport_timestamp);
    merge_into(ctx.current_vector_clock, prepared.clock());

    auto resolved_count = std::size_t{0};
    const auto recorded_at = now_millis();
    for (std::size_t i = 0; i < conflicts.size(); ++i) {
        auto& d = decided[i];
        const auto open = !d.resolution.outcome;
        ctx.conflict_history.push_back(ConflictRecord{
            .conflict = conflicts[i],
            .strategy = d.choice.strategy,
            .resolver = d.resolution.resolver,
            .status = open ? ConflictStatus::open : ConflictStatus::resolved,
            .outcome_operation_id =
                open ? std::nullopt : std::optional<std::string>{d.resolution.outcome->id},
            .recorded_at = recorded_at,
            .resolution_time_ms = d.time_ms,
            .confidence = d.resolution.confidence,
        });
        if (open) {
            ctx.active_conflicts.insert_or_assign(conflicts[i].id, conflicts[i]);
        } else {
            ++resolved_count;
            ctx.monitor.record_resolution(true);
        }
    }

    if (held) {
        VLOG(1) << "operation " << prepared.id << " held back by an open manual conflict";
    } else if (whole) {
        apply_operation(ctx.element_states, transformed);
    } else {
        for (const auto& part : parts) apply_operation(ctx.element_states, part);
    }

    ctx.pending_operations.insert(transformed);
    while (ctx.pending_operations.size() > config_.max_pending_operations) {
        auto evicted = ctx.pending_operations.pop_front();
        LOG_EVERY_N(WARNING, 100) << "pending operations above " << config_.max_pending_operations
                                  << ", evicted " << (evicted ? evicted->id : std::string{});
    }
    ++ctx.canvas_version;
    ++ctx.generation;

    // -- Metrics and throttle -------------------------------------------------

    const auto latency = elapsed_ms(started);
    const auto memory = estimate_memory_mb(ctx);
    const auto queue_size = ctx.operation_queue.size() + ctx.pending_operations.size();
    const auto active_users = ctx.current_vector_clock.size();

    ctx.monitor.record(latency, conflicts.size());
    ctx.monitor.set_gauges(memory, active_users, queue_size);
    ctx.performance_metrics = ctx.monitor.snapshot();
    const auto sample = Sample{latency, conflicts.size(), resolved_count,
                               memory,  active_users,     queue_size};
    if (deferred != nullptr) {
        deferred->push_back(sample);
    } else {
        record_sample(sample);
    }
    adjust_throttle(ctx.adaptive_throttling, latency, config_.throttle);

    VLOG(1) << "transformed " << prepared.id << " (" << prepared.type_name() << ") with "
            << conflicts.size() << " conflicts in " << latency << " ms";

    auto result = TransformResult{
        .transformed_operation = std::move(transformed),
        .conflicts = std::move(conflicts),
        .performance = TransformPerformance{latency, memory, queue_size},
    };
    ctx.recent_results.put(prepared.id, result);
    return result;
}

auto Engine::transform_all(const std::vector<Operation>& ops, TransformContext& ctx,
                           const TransformOptions& options) -> std::vector<TransformResult> {
    auto saved = ctx;
    const auto history_mark = ctx.conflict_history.size();

    // Restore the saved context, keeping the failure records appended by
    // the aborted attempt.
    auto rollback = [&] {
        auto failures = std::vector<ConflictRecord>{};
        for (auto i = history_mark; i < ctx.conflict_history.size(); ++i) {
            if (ctx.conflict_history[i].status == ConflictStatus::failed) {
                failures.push_back(std::move(ctx.conflict_history[i]));
            }
        }
        ctx = std::move(saved);
        std::ranges::move(failures, std::back_inserter(ctx.conflict_history));
        if (!failures.empty()) ++ctx.generation;
    };

    auto results = std::vector<TransformResult>{};
    results.reserve(ops.size());
    auto samples = std::vector<Sample>{};
    try {
        for (const auto& op : ops) results.push_back(transform_one(op, ctx, options, &samples));
    } catch (const Error& e) {
        rollback();
        if (is_rejection(e.kind)) {
            ctx.monitor.record_rejection();
            ctx.performance_metrics = ctx.monitor.snapshot();
        }
        throw;
    } catch (...) {
        rollback();
        throw;
    }
    for (const auto& sample : samples) record_sample(sample);
    return results;
}

// -- Manual conflicts -----------------------------------------------------------

auto Engine::resolve_conflict(TransformContext& ctx, std::string_view conflict_id,
                              const Operation& outcome) -> ConflictRecord {
    const auto started = SteadyClock::now();
    auto it = ctx.active_conflicts.find(conflict_id);
    if (it == ctx.active_conflicts.end()) {
        throw Error{ErrorKind::unknown_conflict,
                    "no open conflict with id " + std::string{conflict_id}};
    }
    const auto prepared = prepare(outcome);

    apply_operation(ctx.element_states, prepared);
    auto record = ConflictRecord{
        .conflict = std::move(it->second),
        .strategy = std::string{to_string_view(Strategy::manual)},
        .resolver = "manual",
        .status = ConflictStatus::resolved,
        .outcome_operation_id = prepared.id,
        .recorded_at = now_millis(),
        .resolution_time_ms = elapsed_ms(started),
        .confidence = 1.0,
    };
    ctx.active_conflicts.erase(it);
    ctx.conflict_history.push_back(record);
    ++ctx.canvas_version;
    ++ctx.generation;

    ctx.monitor.record_resolution(true);
    ctx.performance_metrics = ctx.monitor.snapshot();
    {
        auto lock = std::lock_guard{monitor_mutex_};
        monitor_.record_resolution(true);
    }
    LOG(INFO) << "conflict " << record.conflict.id << " resolved manually with "
              << prepared.id;
    return record;
}

auto Engine::abandon_conflict(TransformContext& ctx, std::string_view conflict_id)
    -> ConflictRecord {
    auto it = ctx.active_conflicts.find(conflict_id);
    if (it == ctx.active_conflicts.end()) {
        throw Error{ErrorKind::unknown_conflict,
                    "no open conflict with id " + std::string{conflict_id}};
    }
    auto record = ConflictRecord{
        .conflict = std::move(it->second),
        .strategy = std::string{to_string_view(Strategy::manual)},
        .resolver = "manual",
        .status = ConflictStatus::abandoned,
        .recorded_at = now_millis(),
    };
    ctx.active_conflicts.erase(it);
    ctx.conflict_history.push_back(record);
    ++ctx.generation;

    ctx.monitor.record_resolution(false);
    ctx.performance_metrics = ctx.monitor.snapshot();
    {
        auto lock = std::lock_guard{monitor_mutex_};
        monitor_.record_resolution(false);
    }
    LOG(INFO) << "conflict " << record.conflict.id << " abandoned";
    return record;
}

// -- Resolvers ------------------------------------------------------------------

void Engine::register_resolver(ConflictType type,
                               std::shared_ptr<const ConflictResolver> resolver) {
    auto lock = std::unique_lock{resolvers_mutex_};
    if (resolver) {
        resolvers_.insert_or_assign(type, std::move(resolver));
    } else {
        resolvers_.erase(type);
    }
}

void Engine::unregister_resolver(ConflictType type) {
    auto lock = std::unique_lock{resolvers_mutex_};
    resolvers_.erase(type);
}

auto Engine::resolver_for(ConflictType type) const -> std::shared_ptr<const ConflictResolver> {
    auto lock = std::shared_lock{resolvers_mutex_};
    auto it = resolvers_.find(type);
    return it != resolvers_.end() ? it->second : nullptr;
}

// -- Utilities ------------------------------------------------------------------

auto Engine::compress(const std::vector<Operation>& ops) const -> std::vector<Operation> {
    return whiteboard_ot::compress(ops);
}

void Engine::record_sample(const Sample& sample) {
    auto lock = std::lock_guard{monitor_mutex_};
    for (std::size_t i = 0; i < sample.resolved; ++i) monitor_.record_resolution(true);
    monitor_.record(sample.latency_ms, sample.conflicts);
    monitor_.set_gauges(sample.memory_usage_mb, sample.active_users, sample.queue_size);
}

auto Engine::metrics() const -> PerformanceMetrics {
    auto lock = std::lock_guard{monitor_mutex_};
    return monitor_.snapshot();
}

auto Engine::estimate_memory_mb(const TransformContext& ctx) -> double {
    auto bytes = ctx.pending_operations.approximate_bytes() +
                 ctx.operation_queue.approximate_bytes();
    bytes += ctx.element_states.size() * (sizeof(ElementState) + 64);
    bytes += ctx.conflict_history.size() * (sizeof(ConflictRecord) + 2 * sizeof(Operation));
    bytes += ctx.active_conflicts.size() * (sizeof(ConflictInfo) + 2 * sizeof(Operation));
    bytes += ctx.recent_results.size() * sizeof(TransformResult);
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

}  // namespace whiteboard_ot
