#include <whiteboard-ot/conflict_resolver.hpp>

#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/error.hpp>

#include <algorithm>
#include <array>
#include <tuple>

namespace whiteboard_ot {

namespace {

constexpr auto all_strategies = std::array{
    Strategy::merge, Strategy::last_writer_wins, Strategy::priority_user, Strategy::manual,
};

void require_operations(const std::vector<Operation>& ops) {
    if (ops.empty()) {
        throw Error{ErrorKind::empty_conflict, "Cannot resolve conflict with no operations"};
    }
}

// Writer order: Lamport timestamp, then user id, then operation id.
auto writes_before(const Operation& a, const Operation& b) -> bool {
    return std::tie(a.lamport_timestamp, a.user_id, a.id) <
           std::tie(b.lamport_timestamp, b.user_id, b.id);
}

auto priority_of(const UserPriorities& priorities, const std::string& user_id) -> double {
    auto it = priorities.find(user_id);
    return it != priorities.end() ? it->second : 0.0;
}

}  // namespace

auto parse_strategy(std::string_view name) -> std::optional<Strategy> {
    auto it = std::ranges::find_if(all_strategies,
                                   [&](Strategy s) { return to_string_view(s) == name; });
    if (it == all_strategies.end()) return std::nullopt;
    return *it;
}

auto last_writer(const std::vector<Operation>& ops) -> const Operation& {
    require_operations(ops);
    return *std::ranges::max_element(ops, writes_before);
}

auto highest_priority(const std::vector<Operation>& ops, const UserPriorities& priorities)
    -> const Operation& {
    require_operations(ops);
    return *std::ranges::max_element(ops, [&](const Operation& a, const Operation& b) {
        const auto pa = priority_of(priorities, a.user_id);
        const auto pb = priority_of(priorities, b.user_id);
        if (pa != pb) return pa < pb;
        return writes_before(a, b);
    });
}

auto merge_operations(const std::vector<Operation>& ops) -> Operation {
    require_operations(ops);

    // Fields of different elements never mix.
    const auto& element = ops.front().element_id;
    if (!std::ranges::all_of(ops, [&](const Operation& op) { return op.element_id == element; })) {
        return last_writer(ops);
    }

    auto order = std::vector<const Operation*>{};
    order.reserve(ops.size());
    for (const auto& op : ops) order.push_back(&op);
    std::ranges::stable_sort(order, [](const Operation* a, const Operation* b) {
        return writes_before(*a, *b);
    });

    auto merged = ops.front();
    merged.data = nullptr;
    merged.style.reset();
    auto clock = std::optional<VectorClock>{};

    for (const auto* op : order) {
        overlay(merged.data, op->data);
        if (op->style) {
            if (!merged.style) merged.style = nlohmann::json{};
            overlay(*merged.style, *op->style);
        }
        if (op->position) merged.position = op->position;
        if (op->bounds) merged.bounds = op->bounds;
        if (op->rotation) merged.rotation = op->rotation;
        if (op->z_index) merged.z_index = op->z_index;
        if (op->vector_clock) {
            if (!clock) clock = VectorClock{};
            merge_into(*clock, *op->vector_clock);
        }
        merged.lamport_timestamp = std::max(merged.lamport_timestamp, op->lamport_timestamp);
    }
    merged.vector_clock = std::move(clock);
    return merged;
}

auto default_strategy(const ConflictInfo& conflict, const UserPriorities& priorities,
                      const EngineConfig& config) -> Strategy {
    if (auto it = config.strategy_overrides.find(conflict.type);
        it != config.strategy_overrides.end()) {
        return it->second;
    }
    switch (conflict.type) {
        case ConflictType::spatial:
            return Strategy::last_writer_wins;
        case ConflictType::temporal:
            return priorities.empty() ? Strategy::last_writer_wins : Strategy::priority_user;
        case ConflictType::semantic:
            return conflict.severity >= Severity::high ? Strategy::last_writer_wins
                                                       : Strategy::merge;
        case ConflictType::concurrent_modification:
            return Strategy::merge;
    }
    return Strategy::merge;
}

auto resolution_confidence(const ConflictInfo& conflict, Strategy strategy,
                           const Resolution& resolution) -> double {
    if (!resolution.outcome) return 0.0;

    auto confidence = 0.5;
    if (conflict.type == ConflictType::temporal && conflict.operations.size() == 2) {
        confidence += 0.3;
    }
    if (conflict.type == ConflictType::semantic && conflict.semantic &&
        conflict.semantic->incompatible_changes.size() > 2) {
        confidence -= 0.2;
    }
    if (strategy == Strategy::merge && !resolution.outcome->data.is_null()) {
        confidence += 0.2;
    }
    return std::clamp(confidence, 0.0, 1.0);
}

auto resolve(Strategy strategy, const ConflictInfo& conflict, const UserPriorities& priorities)
    -> Resolution {
    const auto& ops = conflict.operations;
    require_operations(ops);

    auto resolution = Resolution{};
    resolution.resolver = std::string{to_string_view(strategy)};
    switch (strategy) {
        case Strategy::merge:
            resolution.outcome = merge_operations(ops);
            break;
        case Strategy::last_writer_wins:
            resolution.outcome = last_writer(ops);
            break;
        case Strategy::priority_user:
            resolution.outcome = ops.size() == 1 ? ops.front() : highest_priority(ops, priorities);
            break;
        case Strategy::manual:
            break;
    }
    resolution.confidence = resolution_confidence(conflict, strategy, resolution);
    return resolution;
}

auto StrategyResolver::resolve(const ConflictInfo& conflict,
                               const UserPriorities& priorities) const -> Resolution {
    return whiteboard_ot::resolve(strategy_, conflict, priorities);
}

auto FunctionResolver::resolve(const ConflictInfo& conflict,
                               const UserPriorities& priorities) const -> Resolution {
    if (conflict.operations.empty()) {
        throw Error{ErrorKind::empty_conflict, "Cannot resolve conflict with no operations"};
    }
    auto resolution = fn_(conflict, priorities);
    if (resolution.resolver.empty()) resolution.resolver = name_;
    return resolution;
}

}  // namespace whiteboard_ot
