#include "validation.hpp"

#include <whiteboard-ot/error.hpp>

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

namespace whiteboard_ot::detail {

namespace {

auto reject(const Operation& op, const std::string& what) -> Error {
    return Error{ErrorKind::invalid_operation, "operation " + op.id + ": " + what};
}

void check_coordinate(const Operation& op, double value, const char* name,
                      const EngineConfig& config) {
    if (!std::isfinite(value)) throw reject(op, std::string{name} + " is not finite");
    if (std::abs(value) > config.coordinate_limit) {
        throw reject(op, std::string{name} + " is outside the canvas");
    }
}

void check_geometry(const Operation& op, const EngineConfig& config) {
    if (op.position) {
        check_coordinate(op, op.position->x, "position.x", config);
        check_coordinate(op, op.position->y, "position.y", config);
    }
    if (op.bounds) {
        check_coordinate(op, op.bounds->x, "bounds.x", config);
        check_coordinate(op, op.bounds->y, "bounds.y", config);
        for (auto [value, name] : {std::pair{op.bounds->width, "bounds.width"},
                                   std::pair{op.bounds->height, "bounds.height"}}) {
            if (!std::isfinite(value) || value < 0.0) {
                throw reject(op, std::string{name} + " must be a non-negative number");
            }
            if (value > config.max_extent) throw reject(op, std::string{name} + " is too large");
        }
    }
    if (op.rotation && !std::isfinite(*op.rotation)) throw reject(op, "rotation is not finite");
}

void check_style(const Operation& op, const EngineConfig& config) {
    if (!op.style || op.style->is_null()) return;
    if (!op.style->is_object()) throw reject(op, "style must be an object");
    if (op.style->size() > config.max_style_properties) {
        throw reject(op, "style has " + std::to_string(op.style->size()) +
                             " properties, limit is " +
                             std::to_string(config.max_style_properties));
    }
}

void check_identity(const Operation& op) {
    if (!op.vector_clock) {
        throw Error{ErrorKind::missing_vector_clock, "operation " + op.id + " has no vector clock"};
    }
    if (op.vector_clock->empty()) {
        throw Error{ErrorKind::missing_vector_clock,
                    "operation " + op.id + " has an empty vector clock"};
    }
    if (op.id.empty()) throw reject(op, "id is empty");
    if (op.user_id.empty()) throw reject(op, "user id is empty");
    if (op.element_id.empty() && op.type != OpType::batch) throw reject(op, "element id is empty");
}

}  // namespace

auto json_depth(const nlohmann::json& j) -> std::size_t {
    if (!j.is_structured()) return 0;
    auto deepest = std::size_t{0};
    for (const auto& child : j) deepest = std::max(deepest, json_depth(child));
    return deepest + 1;
}

auto truncate_depth(nlohmann::json& j, std::size_t max_depth) -> bool {
    if (!j.is_structured()) return false;
    if (max_depth == 0) {
        j = nullptr;
        return true;
    }
    auto dropped = false;
    for (auto& child : j) dropped = truncate_depth(child, max_depth - 1) || dropped;
    return dropped;
}

auto validate_operation(const Operation& op, const EngineConfig& config) -> Operation {
    check_identity(op);
    check_geometry(op, config);
    check_style(op, config);

    auto sanitized = op;

    if (op.type == OpType::batch) {
        // Nested entries inherit the batch clock, so each is checked on
        // its own; the batch payload itself is not truncated.
        for (const auto& part : expand_operation(op)) {
            check_identity(part);
            check_geometry(part, config);
            check_style(part, config);
        }
    } else if (truncate_depth(sanitized.data, config.max_payload_depth)) {
        LOG(WARNING) << "operation " << op.id << ": payload nested deeper than "
                     << config.max_payload_depth << " levels was truncated";
    }

    if (op.timestamp != 0) {
        const auto skew = std::abs(op.timestamp - now_millis());
        if (skew > config.max_clock_skew_ms) {
            LOG_EVERY_N(WARNING, 100) << "operation " << op.id << " timestamp is " << skew
                                      << " ms away from local time";
        }
    }
    return sanitized;
}

}  // namespace whiteboard_ot::detail
