/// @file json.hpp
/// @brief nlohmann/json interoperability for whiteboard-ot.
///
/// ADL serialization (to_json/from_json) for the public types. Keys are
/// camelCase to match the clients that produce operations.

#pragma once

#include <whiteboard-ot/config.hpp>
#include <whiteboard-ot/conflict.hpp>
#include <whiteboard-ot/context.hpp>
#include <whiteboard-ot/element_state.hpp>
#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/performance_monitor.hpp>
#include <whiteboard-ot/types.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

namespace whiteboard_ot {

// -- Geometry -----------------------------------------------------------------

void to_json(nlohmann::json& j, const Point& p);
void from_json(const nlohmann::json& j, Point& p);

void to_json(nlohmann::json& j, const Rect& r);
void from_json(const nlohmann::json& j, Rect& r);

// -- Enums (string names) -----------------------------------------------------

void to_json(nlohmann::json& j, OpType type);
void to_json(nlohmann::json& j, ConflictType type);
void from_json(const nlohmann::json& j, ConflictType& type);
void to_json(nlohmann::json& j, Severity severity);
void from_json(const nlohmann::json& j, Severity& severity);
void to_json(nlohmann::json& j, Strategy strategy);
void from_json(const nlohmann::json& j, Strategy& strategy);
void to_json(nlohmann::json& j, ConflictStatus status);

// -- Operations ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Metadata& m);
void from_json(const nlohmann::json& j, Metadata& m);

/// A missing or null `vectorClock` decodes to std::nullopt so that the
/// engine can reject it; unknown `type` strings are kept in `raw_type`.
void to_json(nlohmann::json& j, const Operation& op);
void from_json(const nlohmann::json& j, Operation& op);

/// Parse an operation from JSON text.
/// @throws Error (decoding_error) on malformed input.
auto parse_operation(std::string_view text) -> Operation;

// -- State and results ---------------------------------------------------------

void to_json(nlohmann::json& j, const ElementState& s);
void from_json(const nlohmann::json& j, ElementState& s);

void to_json(nlohmann::json& j, const ConflictInfo& c);
void to_json(nlohmann::json& j, const ConflictRecord& r);
void to_json(nlohmann::json& j, const PerformanceMetrics& m);
void to_json(nlohmann::json& j, const AdaptiveThrottling& t);
void to_json(nlohmann::json& j, const TransformResult& r);

// -- Configuration ---------------------------------------------------------------

void to_json(nlohmann::json& j, const ThrottleConfig& c);
void from_json(const nlohmann::json& j, ThrottleConfig& c);

/// Keys absent from `j` keep their defaults. Values are not validated
/// here; see validate().
void to_json(nlohmann::json& j, const EngineConfig& c);
void from_json(const nlohmann::json& j, EngineConfig& c);

}  // namespace whiteboard_ot
