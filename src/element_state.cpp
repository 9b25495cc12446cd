#include <whiteboard-ot/element_state.hpp>

#include <utility>

namespace whiteboard_ot {

namespace {

void stamp(ElementState& state, const Operation& op) {
    state.last_operation_id = op.id;
    state.last_user_id = op.user_id;
    state.last_timestamp = op.timestamp;
    state.version = op.version;
    state.lamport_timestamp = op.lamport_timestamp;
}

auto fresh(const std::string& element_id) -> ElementState {
    auto state = ElementState{};
    state.element_id = element_id;
    return state;
}

void apply_create(ElementStates& states, const Operation& op) {
    auto state = fresh(op.element_id);
    state.element_type = op.element_type;
    state.data = op.data;
    state.position = op.position;
    state.bounds = op.bounds;
    state.style = op.style.value_or(nlohmann::json{});
    state.rotation = op.rotation;
    state.z_index = op.z_index;
    stamp(state, op);
    states.insert_or_assign(op.element_id, std::move(state));
}

void apply_delete(ElementStates& states, const Operation& op) {
    // A tombstone carries no content, whatever the element held before.
    auto state = fresh(op.element_id);
    state.deleted = true;
    stamp(state, op);
    states.insert_or_assign(op.element_id, std::move(state));
}

void apply_fields(ElementStates& states, const Operation& op) {
    auto [it, inserted] = states.try_emplace(op.element_id, fresh(op.element_id));
    auto& state = it->second;
    if (state.deleted) state = fresh(op.element_id);

    if (op.element_type) state.element_type = op.element_type;
    overlay(state.data, op.data);
    if (op.position) state.position = op.position;
    if (op.bounds) state.bounds = op.bounds;
    if (op.style) overlay(state.style, *op.style);
    if (op.rotation) state.rotation = op.rotation;
    if (op.z_index) state.z_index = op.z_index;
    stamp(state, op);
}

}  // namespace

void overlay(nlohmann::json& target, const nlohmann::json& patch) {
    if (patch.is_null()) return;
    if (target.is_object() && patch.is_object()) {
        for (const auto& [key, value] : patch.items()) {
            target[key] = value;
        }
        return;
    }
    target = patch;
}

void apply_operation(ElementStates& states, const Operation& op) {
    switch (op.type) {
        case OpType::create:
            apply_create(states, op);
            return;
        case OpType::del:
            apply_delete(states, op);
            return;
        case OpType::compound:
        case OpType::batch:
            for (const auto& part : expand_operation(op)) {
                apply_operation(states, part);
            }
            return;
        case OpType::unknown:
            return;
        default:
            apply_fields(states, op);
            return;
    }
}

}  // namespace whiteboard_ot
