#pragma once

// Operation validation and payload sanitization.
//
// Internal header; not installed.

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/operation.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>

namespace whiteboard_ot::detail {

// Check an operation against the engine limits and return a sanitized
// copy (payload nesting truncated to config.max_payload_depth).
// Throws Error (missing_vector_clock, invalid_operation) when rejected.
auto validate_operation(const Operation& op, const EngineConfig& config) -> Operation;

// Nesting depth of structured values: scalars 0, a flat object 1.
auto json_depth(const nlohmann::json& j) -> std::size_t;

// Replace containers nested deeper than max_depth with null.
// Returns true when anything was dropped.
auto truncate_depth(nlohmann::json& j, std::size_t max_depth) -> bool;

}  // namespace whiteboard_ot::detail
