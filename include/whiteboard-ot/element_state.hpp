/// @file element_state.hpp
/// @brief Last-known snapshot of a canvas element and how operations change it.

#pragma once

#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/types.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace whiteboard_ot {

/// The state of one element after every completed operation on it.
struct ElementState {
    std::string element_id;
    std::optional<std::string> element_type{};
    nlohmann::json data{};
    std::optional<Point> position{};
    std::optional<Rect> bounds{};
    nlohmann::json style{};
    std::optional<double> rotation{};
    std::optional<std::int64_t> z_index{};
    bool deleted{false};

    // Provenance of the last applied operation.
    std::string last_operation_id{};
    std::string last_user_id{};
    Millis last_timestamp{0};
    std::uint64_t version{0};
    std::uint64_t lamport_timestamp{0};

    auto operator==(const ElementState&) const -> bool = default;

    /// Compare the visible content only, ignoring provenance.
    auto same_content(const ElementState& other) const -> bool {
        return element_id == other.element_id && element_type == other.element_type &&
               data == other.data && position == other.position &&
               bounds == other.bounds && style == other.style &&
               rotation == other.rotation && z_index == other.z_index &&
               deleted == other.deleted;
    }
};

/// Element id → snapshot.
using ElementStates = std::unordered_map<std::string, ElementState>;

/// Shallow key overlay used for `data` and `style`.
///
/// Object onto object copies each key of `patch` over `target`. A null
/// patch leaves `target` unchanged. Any other combination replaces
/// `target` with `patch`.
void overlay(nlohmann::json& target, const nlohmann::json& patch);

/// Apply one operation to the element states.
///
/// create replaces the element; delete leaves a tombstone; field updates
/// overlay the fields they carry and treat a missing or deleted element
/// as a fresh one; compound and batch operations apply their parts in
/// order; unknown operations change nothing.
void apply_operation(ElementStates& states, const Operation& op);

}  // namespace whiteboard_ot
