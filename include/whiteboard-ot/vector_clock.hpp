/// @file vector_clock.hpp
/// @brief Causality tracking: vector clocks and the Lamport clock.

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace whiteboard_ot {

/// Per-user counters capturing causal history. Missing entries count as 0.
using VectorClock = std::map<std::string, std::uint64_t, std::less<>>;

/// The causal relationship of one clock to another.
enum class Causality : std::uint8_t {
    before,      ///< Every entry <= the other's, at least one strictly less.
    after,       ///< Every entry >= the other's, at least one strictly greater.
    concurrent,  ///< Neither dominates (identical clocks included).
};

/// Convert a Causality to its string representation.
constexpr auto to_string_view(Causality c) noexcept -> std::string_view {
    switch (c) {
        case Causality::before:     return "before";
        case Causality::after:      return "after";
        case Causality::concurrent: return "concurrent";
    }
    return "unknown";
}

/// Compare `a` against `b` by componentwise dominance.
///
/// Two distinct operations carrying identical clocks have not observed
/// each other, so identical clocks compare as concurrent.
auto compare(const VectorClock& a, const VectorClock& b) -> Causality;

/// Return a copy of `clock` with `user_id`'s counter incremented.
auto advance_clock(VectorClock clock, std::string_view user_id) -> VectorClock;

/// Componentwise maximum of two clocks.
auto merge(const VectorClock& a, const VectorClock& b) -> VectorClock;

/// Merge `other` into `into` in place.
void merge_into(VectorClock& into, const VectorClock& other);

/// Number of user entries whose counters differ, when `a` and `b` are
/// concurrent. Causally ordered clocks have divergence 0.
auto divergence(const VectorClock& a, const VectorClock& b) -> std::size_t;

/// Counter for a user, 0 when absent.
inline auto counter_of(const VectorClock& clock, std::string_view user_id) -> std::uint64_t {
    auto it = clock.find(user_id);
    return it != clock.end() ? it->second : 0;
}

/// A monotonically increasing scalar clock.
///
/// Gives a total order consistent with causality, used to break ties
/// between operations whose vector clocks are concurrent.
class LamportClock {
public:
    LamportClock() = default;
    explicit LamportClock(std::uint64_t start) : value_{start} {}

    /// Advance for a locally generated event.
    auto tick() -> std::uint64_t { return ++value_; }

    /// Advance past a received timestamp: max(local, remote) + 1.
    auto receive(std::uint64_t remote) -> std::uint64_t {
        value_ = (remote > value_ ? remote : value_) + 1;
        return value_;
    }

    auto value() const -> std::uint64_t { return value_; }

private:
    std::uint64_t value_{0};
};

}  // namespace whiteboard_ot
