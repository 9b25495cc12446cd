#include <whiteboard-ot/compressor.hpp>

#include <whiteboard-ot/element_state.hpp>

#include <algorithm>
#include <map>
#include <string>

namespace whiteboard_ot {

namespace {

// Field updates whose data or style is neither an object nor null
// replace rather than overlay, which does not compose; they stay
// standalone.
auto composable(const Operation& op) -> bool {
    auto patch = [](const nlohmann::json& j) { return j.is_null() || j.is_object(); };
    return patch(op.data) && (!op.style || patch(*op.style));
}

void clear_content(Operation& op) {
    op.element_type.reset();
    op.data = nullptr;
    op.position.reset();
    op.bounds.reset();
    op.style.reset();
    op.rotation.reset();
    op.z_index.reset();
}

void take_content(Operation& into, const Operation& from) {
    into.element_type = from.element_type;
    into.data = from.data;
    into.position = from.position;
    into.bounds = from.bounds;
    into.style = from.style;
    into.rotation = from.rotation;
    into.z_index = from.z_index;
}

void overlay_content(Operation& into, const Operation& from) {
    if (from.element_type) into.element_type = from.element_type;
    overlay(into.data, from.data);
    if (from.style) {
        if (into.style) overlay(*into.style, *from.style);
        else into.style = from.style;
    }
    if (from.position) into.position = from.position;
    if (from.bounds) into.bounds = from.bounds;
    if (from.rotation) into.rotation = from.rotation;
    if (from.z_index) into.z_index = from.z_index;
}

void note_parent(Operation& into, const std::string& id) {
    if (id == into.id) return;
    if (std::ranges::find(into.parent_operations, id) == into.parent_operations.end()) {
        into.parent_operations.push_back(id);
    }
}

// Fold `next` into the run accumulated in `acc`. Identity stays with acc.
void fold(Operation& acc, const Operation& next) {
    switch (next.type) {
        case OpType::del:
            acc.type = OpType::del;
            clear_content(acc);
            break;
        case OpType::create:
            acc.type = OpType::create;
            take_content(acc, next);
            break;
        default:
            if (acc.type == OpType::del) {
                // A write after a delete starts the element over.
                acc.type = OpType::create;
                take_content(acc, next);
            } else {
                overlay_content(acc, next);
            }
            break;
    }

    acc.timestamp = next.timestamp;
    acc.version = next.version;
    acc.lamport_timestamp = std::max(acc.lamport_timestamp, next.lamport_timestamp);
    if (next.vector_clock) {
        if (acc.vector_clock) merge_into(*acc.vector_clock, *next.vector_clock);
        else acc.vector_clock = next.vector_clock;
    }
    note_parent(acc, next.id);
    for (const auto& parent : next.parent_operations) note_parent(acc, parent);
}

}  // namespace

auto compress(const std::vector<Operation>& ops) -> std::vector<Operation> {
    auto out = std::vector<Operation>{};
    out.reserve(ops.size());
    auto open_runs = std::map<std::string, std::size_t, std::less<>>{};

    for (const auto& op : ops) {
        switch (op.type) {
            case OpType::batch:
                open_runs.clear();
                out.push_back(op);
                continue;
            case OpType::compound:
            case OpType::unknown:
                open_runs.erase(op.element_id);
                out.push_back(op);
                continue;
            default:
                break;
        }

        if (is_field_update(op.type) && !composable(op)) {
            open_runs.erase(op.element_id);
            out.push_back(op);
            continue;
        }

        if (auto it = open_runs.find(op.element_id); it != open_runs.end()) {
            fold(out[it->second], op);
        } else {
            open_runs.emplace(op.element_id, out.size());
            out.push_back(op);
        }
    }
    return out;
}

}  // namespace whiteboard_ot
