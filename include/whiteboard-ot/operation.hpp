/// @file operation.hpp
/// @brief The whiteboard edit operation and its type taxonomy.

#pragma once

#include <whiteboard-ot/types.hpp>
#include <whiteboard-ot/vector_clock.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whiteboard_ot {

/// The kind of edit an operation represents.
enum class OpType : std::uint8_t {
    create,    ///< Create an element.
    update,    ///< Field-level update of data, geometry or style.
    move,      ///< Change position (and optionally bounds).
    style,     ///< Change style properties.
    del,       ///< Delete an element.
    compound,  ///< Move + resize + rotate carried in `data`.
    batch,     ///< Several operations carried in `data.operations`.
    resize,    ///< Change bounds.
    rotate,    ///< Change rotation.
    reorder,   ///< Change z-index.
    unknown,   ///< Unrecognized type; passed through unchanged.
};

/// Convert an OpType to its wire name ("delete" for OpType::del).
constexpr auto to_string_view(OpType type) noexcept -> std::string_view {
    switch (type) {
        case OpType::create:   return "create";
        case OpType::update:   return "update";
        case OpType::move:     return "move";
        case OpType::style:    return "style";
        case OpType::del:      return "delete";
        case OpType::compound: return "compound";
        case OpType::batch:    return "batch";
        case OpType::resize:   return "resize";
        case OpType::rotate:   return "rotate";
        case OpType::reorder:  return "reorder";
        case OpType::unknown:  return "unknown";
    }
    return "unknown";
}

/// Parse a wire name. Unrecognized names map to OpType::unknown.
auto parse_op_type(std::string_view name) -> OpType;

/// True for types whose effect on an element is a field-level overlay.
constexpr auto is_field_update(OpType type) noexcept -> bool {
    switch (type) {
        case OpType::update:
        case OpType::move:
        case OpType::style:
        case OpType::resize:
        case OpType::rotate:
        case OpType::reorder:
            return true;
        default:
            return false;
    }
}

/// Client-supplied context carried with an operation.
struct Metadata {
    std::optional<std::string> client_id;   ///< Issuing client connection.
    std::optional<std::string> session_id;  ///< Issuing editing session.
    nlohmann::json extra{};                 ///< Free-form fields.

    auto operator==(const Metadata&) const -> bool = default;
};

/// A single edit to the canvas.
///
/// Operations are immutable records: the engine returns transformed
/// copies and never edits its input. `vector_clock` is optional only so
/// that a missing clock can be represented and rejected; a valid
/// operation always carries a non-empty clock.
struct Operation {
    std::string id;                                ///< Unique operation id.
    OpType type{OpType::update};                   ///< The kind of edit.
    std::string raw_type{};                        ///< Original type name when type == unknown.
    std::string element_id;                        ///< Target element.
    std::optional<std::string> element_type{};     ///< e.g. "rectangle".
    nlohmann::json data{};                         ///< Opaque payload.
    std::optional<Point> position{};               ///< New position.
    std::optional<Rect> bounds{};                  ///< New bounding box.
    std::optional<nlohmann::json> style{};         ///< Style properties (object).
    std::optional<double> rotation{};              ///< Rotation in degrees.
    std::optional<std::int64_t> z_index{};         ///< Stacking order.
    Millis timestamp{0};                           ///< Wall clock, advisory.
    std::uint64_t version{0};                      ///< Per-element client counter.
    std::string user_id;                           ///< Issuing user.
    std::optional<VectorClock> vector_clock{};     ///< Causal history.
    std::uint64_t lamport_timestamp{0};            ///< Scalar logical time.
    std::vector<std::string> parent_operations{};  ///< Referenced operation ids.
    Metadata metadata{};                           ///< Client context.

    auto operator==(const Operation&) const -> bool = default;

    /// The type name as it appeared on input.
    auto type_name() const -> std::string_view {
        return type == OpType::unknown ? std::string_view{raw_type} : to_string_view(type);
    }

    /// The clock, or an empty clock when absent.
    auto clock() const -> const VectorClock& {
        static const auto empty = VectorClock{};
        return vector_clock ? *vector_clock : empty;
    }

    /// Position, falling back to the bounds origin.
    auto anchor() const -> std::optional<Point> {
        if (position) return position;
        if (bounds) return Point{bounds->x, bounds->y};
        return std::nullopt;
    }

    /// Bounds, falling back to a zero-sized box at the position.
    auto extent() const -> std::optional<Rect> {
        if (bounds) return bounds;
        if (position) return Rect::at(*position);
        return std::nullopt;
    }
};

/// Split an operation into the constituents used for conflict detection
/// and state application.
///
/// - A compound operation yields one part per present component
///   (`data.moves` → move, `data.resize` → resize, `data.rotation` →
///   rotate), each keeping the compound's id; with no components the
///   compound itself is returned as an update.
/// - A batch operation yields its nested operations, recursively. Nested
///   operations inherit user, clock, timestamp, version and Lamport
///   timestamp from the batch when they omit them.
/// - Any other operation yields itself.
///
/// @throws Error (invalid_operation) when a batch payload is malformed.
auto expand_operation(const Operation& op) -> std::vector<Operation>;

/// Every element id an operation touches (nested batch elements included).
auto touched_elements(const Operation& op) -> std::vector<std::string>;

}  // namespace whiteboard_ot
