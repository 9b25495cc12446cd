/// @file conflict_resolver.hpp
/// @brief Resolution strategies and the custom resolver interface.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/operation.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace whiteboard_ot {

/// User id → tie-break weight. Missing users weigh 0.
using UserPriorities = std::map<std::string, double, std::less<>>;

/// Pluggable resolution for one conflict type.
///
/// Register an implementation with Engine::register_resolver() to take
/// over every conflict of that type. Implementations must treat an empty
/// `conflict.operations` as an error.
class ConflictResolver {
public:
    virtual ~ConflictResolver() = default;

    /// Identity recorded in the conflict history.
    virtual auto name() const -> std::string_view = 0;

    /// Choose an outcome, or return a Resolution without outcome to leave
    /// the conflict open.
    virtual auto resolve(const ConflictInfo& conflict,
                         const UserPriorities& priorities) const -> Resolution = 0;
};

/// Resolve with a built-in strategy.
/// @throws Error (empty_conflict) when `conflict.operations` is empty.
auto resolve(Strategy strategy, const ConflictInfo& conflict,
             const UserPriorities& priorities) -> Resolution;

/// Union of the operations' `data` and `style` keys; overlapping keys and
/// geometry go to the last writer; clocks are merged; identity and type
/// come from the first operation. Operations on different elements are
/// not merged: the last writer is returned instead.
/// @throws Error (empty_conflict) when `ops` is empty.
auto merge_operations(const std::vector<Operation>& ops) -> Operation;

/// The operation with the highest Lamport timestamp, ties broken by the
/// greater user id and then the greater operation id.
/// @throws Error (empty_conflict) when `ops` is empty.
auto last_writer(const std::vector<Operation>& ops) -> const Operation&;

/// The operation of the highest-priority user, ties broken by last_writer().
/// @throws Error (empty_conflict) when `ops` is empty.
auto highest_priority(const std::vector<Operation>& ops,
                      const UserPriorities& priorities) -> const Operation&;

/// Strategy used when the caller names none.
///
/// A per-type override in `config` wins. Otherwise: spatial → last writer
/// wins; temporal → priority user when priorities are configured, else last
/// writer wins; semantic → last writer wins when high or critical, else
/// merge; concurrent modification → merge.
auto default_strategy(const ConflictInfo& conflict, const UserPriorities& priorities,
                      const EngineConfig& config) -> Strategy;

/// Heuristic confidence of a resolution in 0..1.
auto resolution_confidence(const ConflictInfo& conflict, Strategy strategy,
                           const Resolution& resolution) -> double;

/// Adapts a built-in strategy to the ConflictResolver interface.
class StrategyResolver : public ConflictResolver {
public:
    explicit StrategyResolver(Strategy strategy) : strategy_{strategy} {}

    auto name() const -> std::string_view override { return to_string_view(strategy_); }
    auto resolve(const ConflictInfo& conflict,
                 const UserPriorities& priorities) const -> Resolution override;

    auto strategy() const -> Strategy { return strategy_; }

private:
    Strategy strategy_;
};

/// Wraps a callable as a named ConflictResolver.
class FunctionResolver : public ConflictResolver {
public:
    using Fn = std::function<Resolution(const ConflictInfo&, const UserPriorities&)>;

    FunctionResolver(std::string name, Fn fn) : name_{std::move(name)}, fn_{std::move(fn)} {}

    auto name() const -> std::string_view override { return name_; }
    auto resolve(const ConflictInfo& conflict,
                 const UserPriorities& priorities) const -> Resolution override;

private:
    std::string name_;
    Fn fn_;
};

}  // namespace whiteboard_ot
