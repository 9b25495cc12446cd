#include <whiteboard-ot/conflict_detector.hpp>

#include "executor.hpp"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iterator>
#include <map>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>

namespace whiteboard_ot {

namespace {

auto conflict_id(ConflictType type, const Operation& a, const Operation& b) -> std::string {
    auto id = std::string{to_string_view(type)};
    id += '_';
    id += a.id;
    id += '_';
    id += b.id;
    return id;
}

auto affected(const Operation& a, const Operation& b) -> std::vector<std::string> {
    if (a.element_id == b.element_id) return {a.element_id};
    return {a.element_id, b.element_id};
}

// Keys present in both objects with different values.
void collect_key_conflicts(const nlohmann::json& first, const nlohmann::json& second,
                           std::string_view prefix, nlohmann::json& out) {
    if (!first.is_object() || !second.is_object()) return;
    for (const auto& [key, value] : first.items()) {
        auto it = second.find(key);
        if (it == second.end() || *it == value) continue;
        out[std::string{prefix} + key] = nlohmann::json{{"first", value}, {"second", *it}};
    }
}

auto without_unknown(std::vector<Operation> parts) -> std::vector<Operation> {
    std::erase_if(parts, [](const Operation& p) { return p.type == OpType::unknown; });
    return parts;
}

auto by_severity_desc(const ConflictInfo& a, const ConflictInfo& b) -> bool {
    return a.severity > b.severity;
}

}  // namespace

ConflictDetector::ConflictDetector(EngineConfig config) : config_{std::move(config)} {}

auto ConflictDetector::spatial(const Operation& a, const Operation& b) const
    -> std::optional<ConflictInfo> {
    if (a.element_id == b.element_id) return std::nullopt;
    const auto ea = a.extent();
    const auto eb = b.extent();
    if (!ea || !eb) return std::nullopt;

    const auto threshold = config_.spatial_proximity_threshold;
    auto conflict = ConflictInfo{};
    conflict.type = ConflictType::spatial;

    if (a.bounds && b.bounds) {
        const auto inter = intersection_area(*a.bounds, *b.bounds);
        const auto uni = a.bounds->area() + b.bounds->area() - inter;
        const auto iou = uni > 0.0 ? inter / uni : 0.0;
        const auto g = gap(*a.bounds, *b.bounds);
        if (inter <= 0.0 && g >= threshold) return std::nullopt;

        if (iou > 0.5) conflict.severity = Severity::high;
        else if (inter > 0.0) conflict.severity = Severity::medium;
        else conflict.severity = Severity::low;
        conflict.spatial_overlap = SpatialOverlap{inter, iou, g};
    } else {
        const auto d = gap(*ea, *eb);
        if (d >= threshold) return std::nullopt;
        conflict.severity = Severity::medium;
        conflict.spatial_overlap = SpatialOverlap{0.0, 0.0, d};
    }
    return conflict;
}

auto ConflictDetector::temporal(const Operation& a, const Operation& b) const
    -> std::optional<ConflictInfo> {
    if (a.element_id != b.element_id) return std::nullopt;
    const auto diff = std::abs(a.timestamp - b.timestamp);
    if (diff >= config_.temporal_window_ms) return std::nullopt;

    const auto simultaneous = diff < config_.simultaneous_window_ms;
    auto conflict = ConflictInfo{};
    conflict.type = ConflictType::temporal;
    conflict.severity = simultaneous ? Severity::high : Severity::medium;
    conflict.temporal_proximity = TemporalProximity{diff, simultaneous};
    return conflict;
}

auto ConflictDetector::semantic(const Operation& a, const Operation& b) const
    -> std::optional<ConflictInfo> {
    if (a.element_id != b.element_id) return std::nullopt;

    auto detail = SemanticDetail{};
    detail.data_conflicts = nlohmann::json::object();
    auto severity = Severity::low;
    auto note = [&](std::string change, Severity s) {
        detail.incompatible_changes.push_back(std::move(change));
        severity = std::max(severity, s);
    };

    const auto a_del = a.type == OpType::del;
    const auto b_del = b.type == OpType::del;
    const auto a_create = a.type == OpType::create;
    const auto b_create = b.type == OpType::create;

    if (a_del != b_del) {
        note("delete-update-conflict", Severity::high);
    } else if (a_create && b_create) {
        note("duplicate-create", Severity::high);
    } else if ((a_create && is_field_update(b.type)) || (b_create && is_field_update(a.type))) {
        note("create-modify-conflict", Severity::medium);
    }

    if (!a_del && !b_del) {
        auto style_conflicts = nlohmann::json::object();
        if (a.style && b.style) collect_key_conflicts(*a.style, *b.style, "style.", style_conflicts);
        if (!style_conflicts.empty()) {
            note("style-property-conflict", Severity::medium);
            detail.data_conflicts.update(style_conflicts);
        }

        auto data_conflicts = nlohmann::json::object();
        collect_key_conflicts(a.data, b.data, "", data_conflicts);
        if (!data_conflicts.empty()) {
            note("data-property-conflict", Severity::medium);
            detail.data_conflicts.update(data_conflicts);
        }
    }

    if (detail.incompatible_changes.empty()) return std::nullopt;

    auto conflict = ConflictInfo{};
    conflict.type = ConflictType::semantic;
    conflict.severity = severity;
    conflict.semantic = std::move(detail);
    return conflict;
}

auto ConflictDetector::classify_parts(const Operation& op, const std::vector<Operation>& op_parts,
                                      const Operation& other,
                                      const std::vector<Operation>& other_parts, Millis now) const
    -> std::vector<ConflictInfo> {
    auto found = std::vector<ConflictInfo>{};
    for (const auto& a : op_parts) {
        for (const auto& b : other_parts) {
            for (auto conflict : {spatial(a, b), temporal(a, b), semantic(a, b)}) {
                if (!conflict) continue;
                conflict->id = conflict_id(conflict->type, a, b);
                conflict->detected_at = now;
                conflict->affected_elements = affected(a, b);
                conflict->vector_clock_divergence = divergence(a.clock(), b.clock());
                // Nested batch entries are reported individually; compound
                // parts are reported as the compound itself.
                conflict->operations = {op.type == OpType::batch ? a : op,
                                        other.type == OpType::batch ? b : other};

                // Parts of one compound share an id: keep the most severe.
                auto same = std::ranges::find(found, conflict->id, &ConflictInfo::id);
                if (same == found.end()) {
                    found.push_back(std::move(*conflict));
                } else if (conflict->severity > same->severity) {
                    *same = std::move(*conflict);
                }
            }
        }
    }
    return found;
}

auto ConflictDetector::classify(const Operation& op, const Operation& other, Millis now) const
    -> std::vector<ConflictInfo> {
    auto conflicts = classify_parts(op, without_unknown(expand_operation(op)), other,
                                    without_unknown(expand_operation(other)), now);
    std::ranges::stable_sort(conflicts, by_severity_desc);
    return conflicts;
}

auto ConflictDetector::detect(const Operation& op,
                              std::initializer_list<const OperationIndex*> sources,
                              Millis now) const -> std::vector<ConflictInfo> {
    return detect_in(op, std::vector<const OperationIndex*>(sources), now);
}

auto ConflictDetector::detect(const Operation& op, const std::vector<Operation>& queue,
                              Millis now) const -> std::vector<ConflictInfo> {
    auto index = OperationIndex{config_.grid_cell_size};
    for (const auto& other : queue) index.insert(other);
    return detect_in(op, {&index}, now);
}

auto ConflictDetector::detect_in(const Operation& op,
                                 const std::vector<const OperationIndex*>& sources,
                                 Millis now) const -> std::vector<ConflictInfo> {
    if (op.type == OpType::unknown) return {};
    const auto op_parts = without_unknown(expand_operation(op));
    if (op_parts.empty()) return {};

    // -- Gather concurrent candidates through the indexes ---------------------

    auto elements = std::vector<std::string>{};
    for (const auto& part : op_parts) {
        if (std::ranges::find(elements, part.element_id) == elements.end()) {
            elements.push_back(part.element_id);
        }
    }

    auto seen = std::unordered_set<std::string>{};
    auto candidates = std::vector<const IndexedOperation*>{};
    auto consider = [&](const IndexedOperation* entry) {
        const auto& other = entry->operation;
        if (other.id == op.id) return;
        if (std::ranges::find(op.parent_operations, other.id) != op.parent_operations.end()) return;
        if (!seen.insert(other.id).second) return;
        if (compare(op.clock(), other.clock()) != Causality::concurrent) return;
        candidates.push_back(entry);
    };

    for (const auto* source : sources) {
        if (source == nullptr) continue;
        for (const auto& element : elements) {
            for (const auto* entry : source->for_element(element)) consider(entry);
        }
        for (const auto& part : op_parts) {
            auto extent = part.extent();
            if (!extent) continue;
            for (const auto* entry : source->within(extent->inflated(config_.spatial_proximity_threshold))) {
                consider(entry);
            }
        }
    }

    // -- Classify --------------------------------------------------------------

    auto conflicts = std::vector<ConflictInfo>{};
    auto classify_range = [&](std::size_t begin, std::size_t end) {
        auto out = std::vector<ConflictInfo>{};
        for (auto i = begin; i < end; ++i) {
            const auto* entry = candidates[i];
            auto other_parts = without_unknown(entry->parts);
            auto found = classify_parts(op, op_parts, entry->operation, other_parts, now);
            std::ranges::move(found, std::back_inserter(out));
        }
        return out;
    };

    if (candidates.size() > config_.parallel_detection_threshold) {
        const auto workers = std::max(1u, std::thread::hardware_concurrency());
        const auto chunks = detail::chunk_count(candidates.size(), workers);
        auto per_chunk = std::vector<std::vector<ConflictInfo>>(chunks);
        detail::run_chunked(candidates.size(), workers,
                            [&](std::size_t index, std::size_t begin, std::size_t end) {
                                per_chunk[index] = classify_range(begin, end);
                            });
        for (auto& chunk : per_chunk) std::ranges::move(chunk, std::back_inserter(conflicts));
        VLOG(2) << "classified " << candidates.size() << " candidates for " << op.id << " in "
                << chunks << " chunks";
    } else {
        conflicts = classify_range(0, candidates.size());
    }

    // -- Escalate by the number of concurrent operations per element ----------

    auto concurrent_on = std::map<std::string, std::size_t>{};
    for (const auto* entry : candidates) {
        for (const auto& element : entry->elements) {
            if (std::ranges::find(elements, element) != elements.end()) ++concurrent_on[element];
        }
    }
    for (auto& conflict : conflicts) {
        auto crowded = std::ranges::any_of(conflict.affected_elements, [&](const std::string& e) {
            auto it = concurrent_on.find(e);
            return it != concurrent_on.end() && it->second >= config_.severity_escalation_count;
        });
        if (crowded) conflict.severity = escalate(conflict.severity);
    }

    std::ranges::stable_sort(conflicts, by_severity_desc);
    return conflicts;
}

}  // namespace whiteboard_ot
