#include <whiteboard-ot/operation.hpp>

#include <whiteboard-ot/error.hpp>
#include <whiteboard-ot/json.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace whiteboard_ot {

namespace {

constexpr auto known_types = std::array{
    OpType::create, OpType::update, OpType::move,   OpType::style,  OpType::del,
    OpType::compound, OpType::batch, OpType::resize, OpType::rotate, OpType::reorder,
};

// A part carries the identity and causality of its parent and only the
// fields of its own component.
auto bare_part(const Operation& op, OpType type) -> Operation {
    auto part = op;
    part.type = type;
    part.raw_type.clear();
    part.data = nullptr;
    part.position.reset();
    part.bounds.reset();
    part.style.reset();
    part.rotation.reset();
    part.z_index.reset();
    return part;
}

auto number_or(const nlohmann::json& j, const char* key, double fallback) -> double {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

auto expand_compound(const Operation& op) -> std::vector<Operation> {
    auto parts = std::vector<Operation>{};
    if (op.data.is_object()) {
        if (auto it = op.data.find("moves"); it != op.data.end() && it->is_object()) {
            auto part = bare_part(op, OpType::move);
            part.position = Point{number_or(*it, "x", 0.0), number_or(*it, "y", 0.0)};
            parts.push_back(std::move(part));
        }
        if (auto it = op.data.find("resize"); it != op.data.end() && it->is_object()) {
            auto part = bare_part(op, OpType::resize);
            const auto width = number_or(*it, "width", 0.0);
            const auto height = number_or(*it, "height", 0.0);
            part.data = nlohmann::json{{"width", width}, {"height", height}};
            if (op.bounds) {
                part.bounds = Rect{op.bounds->x, op.bounds->y, width, height};
            }
            parts.push_back(std::move(part));
        }
        if (auto it = op.data.find("rotation"); it != op.data.end()) {
            auto angle = std::optional<double>{};
            if (it->is_number()) angle = it->get<double>();
            else if (it->is_object()) angle = number_or(*it, "angle", 0.0);
            if (angle) {
                auto part = bare_part(op, OpType::rotate);
                part.rotation = *angle;
                parts.push_back(std::move(part));
            }
        }
    }
    if (parts.empty()) {
        auto part = op;
        part.type = OpType::update;
        parts.push_back(std::move(part));
    }
    return parts;
}

auto decode_nested(const Operation& batch, const nlohmann::json& entry, std::size_t index)
    -> Operation {
    if (!entry.is_object()) {
        throw Error{ErrorKind::invalid_operation,
                    "batch " + batch.id + ": entry " + std::to_string(index) + " is not an object"};
    }
    auto j = entry;
    if (!j.contains("id")) {
        j["id"] = batch.id + "#" + std::to_string(index);
    }

    auto nested = Operation{};
    try {
        from_json(j, nested);
    } catch (const Error& e) {
        throw Error{ErrorKind::invalid_operation,
                    "batch " + batch.id + ": entry " + std::to_string(index) + ": " + e.message};
    } catch (const nlohmann::json::exception& e) {
        throw Error{ErrorKind::invalid_operation,
                    "batch " + batch.id + ": entry " + std::to_string(index) + ": " + e.what()};
    }

    if (nested.user_id.empty()) nested.user_id = batch.user_id;
    if (!nested.vector_clock) nested.vector_clock = batch.vector_clock;
    if (nested.timestamp == 0) nested.timestamp = batch.timestamp;
    if (nested.version == 0) nested.version = batch.version;
    if (nested.lamport_timestamp == 0) nested.lamport_timestamp = batch.lamport_timestamp;
    return nested;
}

void expand_into(const Operation& op, std::vector<Operation>& out) {
    switch (op.type) {
        case OpType::compound: {
            auto parts = expand_compound(op);
            std::ranges::move(parts, std::back_inserter(out));
            return;
        }
        case OpType::batch: {
            auto it = op.data.is_object() ? op.data.find("operations") : op.data.end();
            if (!op.data.is_object() || it == op.data.end() || !it->is_array()) {
                throw Error{ErrorKind::invalid_operation,
                            "batch " + op.id + " requires a data.operations array"};
            }
            auto index = std::size_t{0};
            for (const auto& entry : *it) {
                expand_into(decode_nested(op, entry, index++), out);
            }
            return;
        }
        default:
            out.push_back(op);
            return;
    }
}

}  // namespace

auto parse_op_type(std::string_view name) -> OpType {
    auto it = std::ranges::find_if(known_types, [&](OpType t) { return to_string_view(t) == name; });
    return it != known_types.end() ? *it : OpType::unknown;
}

auto expand_operation(const Operation& op) -> std::vector<Operation> {
    auto parts = std::vector<Operation>{};
    expand_into(op, parts);
    return parts;
}

auto touched_elements(const Operation& op) -> std::vector<std::string> {
    if (op.type != OpType::batch) return {op.element_id};

    auto elements = std::vector<std::string>{};
    for (const auto& part : expand_operation(op)) {
        if (std::ranges::find(elements, part.element_id) == elements.end()) {
            elements.push_back(part.element_id);
        }
    }
    return elements;
}

}  // namespace whiteboard_ot
