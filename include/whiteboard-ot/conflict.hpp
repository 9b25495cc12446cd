/// @file conflict.hpp
/// @brief Conflict descriptions, resolution strategies and audit records.

#pragma once

#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whiteboard_ot {

/// How two concurrent operations collide.
enum class ConflictType : std::uint8_t {
    spatial,                  ///< Geometric overlap or proximity, any elements.
    temporal,                 ///< Same element, timestamps within the window.
    semantic,                 ///< Same element, logically incompatible edits.
    concurrent_modification,  ///< Generic concurrent edit (caller-constructed).
};

constexpr auto to_string_view(ConflictType type) noexcept -> std::string_view {
    switch (type) {
        case ConflictType::spatial:                 return "spatial";
        case ConflictType::temporal:                return "temporal";
        case ConflictType::semantic:                return "semantic";
        case ConflictType::concurrent_modification: return "concurrent_modification";
    }
    return "unknown";
}

/// Conflict severity, ordered from least to most severe.
enum class Severity : std::uint8_t {
    low,
    medium,
    high,
    critical,
};

constexpr auto to_string_view(Severity severity) noexcept -> std::string_view {
    switch (severity) {
        case Severity::low:      return "low";
        case Severity::medium:   return "medium";
        case Severity::high:     return "high";
        case Severity::critical: return "critical";
    }
    return "unknown";
}

/// One level more severe, saturating at critical.
constexpr auto escalate(Severity severity) noexcept -> Severity {
    switch (severity) {
        case Severity::low:      return Severity::medium;
        case Severity::medium:   return Severity::high;
        case Severity::high:
        case Severity::critical: return Severity::critical;
    }
    return Severity::critical;
}

/// Bounding-box intersection metrics of a spatial conflict.
struct SpatialOverlap {
    double area{0.0};        ///< Intersection area.
    double percentage{0.0};  ///< Intersection over union, 0..1.
    double distance{0.0};    ///< Gap between boxes, or anchor distance.

    auto operator==(const SpatialOverlap&) const -> bool = default;
};

/// Timing metrics of a temporal conflict.
struct TemporalProximity {
    Millis time_diff_ms{0};
    bool simultaneous{false};

    auto operator==(const TemporalProximity&) const -> bool = default;
};

/// Details of a semantic conflict.
struct SemanticDetail {
    std::vector<std::string> incompatible_changes;  ///< e.g. "delete-update-conflict".
    nlohmann::json data_conflicts{};                ///< key → {first, second}.

    auto operator==(const SemanticDetail&) const -> bool = default;
};

/// A detected conflict between operations.
///
/// `operations` must never be empty; the first entry is the operation
/// being transformed when the engine creates the conflict.
struct ConflictInfo {
    std::string id;
    ConflictType type{ConflictType::concurrent_modification};
    Severity severity{Severity::low};
    std::vector<Operation> operations;
    Millis detected_at{0};
    std::vector<std::string> affected_elements;
    std::size_t vector_clock_divergence{0};
    std::optional<SpatialOverlap> spatial_overlap{};
    std::optional<TemporalProximity> temporal_proximity{};
    std::optional<SemanticDetail> semantic{};

    auto operator==(const ConflictInfo&) const -> bool = default;
};

/// Built-in resolution strategies.
enum class Strategy : std::uint8_t {
    merge,             ///< Union of non-overlapping fields.
    last_writer_wins,  ///< Highest Lamport timestamp, then user id.
    priority_user,     ///< Highest user priority, then last writer.
    manual,            ///< Leave open for a human decision.
};

constexpr auto to_string_view(Strategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case Strategy::merge:            return "merge";
        case Strategy::last_writer_wins: return "last-writer-wins";
        case Strategy::priority_user:    return "priority-user";
        case Strategy::manual:           return "manual";
    }
    return "unknown";
}

/// Parse a strategy name ("merge", "last-writer-wins", ...).
auto parse_strategy(std::string_view name) -> std::optional<Strategy>;

/// The outcome of resolving one conflict.
struct Resolution {
    std::optional<Operation> outcome;  ///< nullopt = left open (manual).
    std::string resolver;              ///< Name of the resolver that decided.
    double confidence{0.0};            ///< 0..1.

    auto operator==(const Resolution&) const -> bool = default;
};

/// Lifecycle state of a conflict in the audit log.
enum class ConflictStatus : std::uint8_t {
    resolved,   ///< An outcome was chosen automatically or manually.
    open,       ///< Waiting for manual resolution.
    abandoned,  ///< Closed without an outcome.
    failed,     ///< The resolver raised an error.
};

constexpr auto to_string_view(ConflictStatus status) noexcept -> std::string_view {
    switch (status) {
        case ConflictStatus::resolved:  return "resolved";
        case ConflictStatus::open:      return "open";
        case ConflictStatus::abandoned: return "abandoned";
        case ConflictStatus::failed:    return "failed";
    }
    return "unknown";
}

/// An append-only audit entry in the conflict history.
struct ConflictRecord {
    ConflictInfo conflict;
    std::string strategy;                       ///< Strategy name used.
    std::string resolver;                       ///< Resolver identity.
    ConflictStatus status{ConflictStatus::open};
    std::optional<std::string> outcome_operation_id{};
    Millis recorded_at{0};
    double resolution_time_ms{0.0};
    double confidence{0.0};

    auto operator==(const ConflictRecord&) const -> bool = default;
};

}  // namespace whiteboard_ot
