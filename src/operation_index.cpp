#include <whiteboard-ot/operation_index.hpp>

#include <algorithm>
#include <cmath>
#include <optional>

namespace whiteboard_ot {

namespace {

// Extents spanning more cells than this are kept in a side list instead
// of being rasterized into the grid.
constexpr auto max_cells_per_entry = std::int64_t{4096};

auto operation_bytes(const Operation& op) -> std::size_t {
    auto bytes = sizeof(Operation) + op.id.size() + op.element_id.size() + op.user_id.size() +
                 op.raw_type.size();
    if (!op.data.is_null()) bytes += op.data.dump().size();
    if (op.style) bytes += op.style->dump().size();
    for (const auto& [user, counter] : op.clock()) {
        bytes += user.size() + sizeof(counter) + 32;
    }
    for (const auto& parent : op.parent_operations) bytes += parent.size() + sizeof(std::string);
    return bytes;
}

auto finite(const Rect& r) -> bool {
    return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.width) &&
           std::isfinite(r.height);
}

auto touches(const Rect& a, const Rect& b) -> bool {
    return a.x <= b.right() && b.x <= a.right() && a.y <= b.bottom() && b.y <= a.bottom();
}

struct CellRange {
    std::int64_t x0, y0, x1, y1;

    auto count() const -> std::int64_t { return (x1 - x0 + 1) * (y1 - y0 + 1); }
};

auto cell_range(const Rect& r, double cell_size) -> std::optional<CellRange> {
    if (!finite(r)) return std::nullopt;
    const auto x0 = std::floor(r.x / cell_size);
    const auto y0 = std::floor(r.y / cell_size);
    const auto x1 = std::floor(r.right() / cell_size);
    const auto y1 = std::floor(r.bottom() / cell_size);
    constexpr auto limit = 1e15;
    if (std::max({std::abs(x0), std::abs(y0), std::abs(x1), std::abs(y1)}) > limit) {
        return std::nullopt;
    }
    const auto range = CellRange{
        static_cast<std::int64_t>(x0),
        static_cast<std::int64_t>(y0),
        static_cast<std::int64_t>(x1),
        static_cast<std::int64_t>(y1),
    };
    if (range.x1 - range.x0 >= max_cells_per_entry || range.y1 - range.y0 >= max_cells_per_entry ||
        range.count() > max_cells_per_entry) {
        return std::nullopt;
    }
    return range;
}

}  // namespace

OperationIndex::OperationIndex(double cell_size)
    : cell_size_{cell_size > 0.0 ? cell_size : 100.0} {}

void OperationIndex::insert(const Operation& op) {
    auto entry = IndexedOperation{};
    entry.operation = op;
    entry.parts = expand_operation(op);
    entry.elements = touched_elements(op);
    entry.bytes = sizeof(IndexedOperation) + operation_bytes(op);

    auto add_extent = [&](const Rect& extent) {
        entry.extents.push_back(extent);
        auto range = cell_range(extent, cell_size_);
        if (!range) {
            entry.oversized = true;
            return;
        }
        for (auto cx = range->x0; cx <= range->x1; ++cx) {
            for (auto cy = range->y0; cy <= range->y1; ++cy) {
                auto cell = Cell{cx, cy};
                if (std::ranges::find(entry.cells, cell) == entry.cells.end()) {
                    entry.cells.push_back(cell);
                }
            }
        }
    };
    if (auto extent = op.extent()) add_extent(*extent);
    for (const auto& part : entry.parts) {
        if (auto extent = part.extent(); extent && *extent != op.extent()) add_extent(*extent);
    }

    erase(op.id);

    const auto seq = next_seq_++;
    entry.seq = seq;
    by_id_.insert_or_assign(op.id, seq);
    for (const auto& element : entry.elements) by_element_[element].insert(seq);
    for (const auto& cell : entry.cells) by_cell_[cell].insert(seq);
    if (entry.oversized) oversized_.insert(seq);
    bytes_ += entry.bytes;
    entries_.emplace(seq, std::move(entry));
}

void OperationIndex::unlink(const IndexedOperation& entry) {
    by_id_.erase(entry.operation.id);
    for (const auto& element : entry.elements) {
        auto it = by_element_.find(element);
        if (it == by_element_.end()) continue;
        it->second.erase(entry.seq);
        if (it->second.empty()) by_element_.erase(it);
    }
    for (const auto& cell : entry.cells) {
        auto it = by_cell_.find(cell);
        if (it == by_cell_.end()) continue;
        it->second.erase(entry.seq);
        if (it->second.empty()) by_cell_.erase(it);
    }
    oversized_.erase(entry.seq);
    bytes_ -= std::min(bytes_, entry.bytes);
}

auto OperationIndex::erase(std::string_view id) -> bool {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return false;
    auto entry = entries_.find(it->second);
    unlink(entry->second);
    entries_.erase(entry);
    return true;
}

auto OperationIndex::pop_front() -> std::optional<Operation> {
    if (entries_.empty()) return std::nullopt;
    auto node = entries_.extract(entries_.begin());
    unlink(node.mapped());
    return std::move(node.mapped().operation);
}

void OperationIndex::clear() {
    entries_.clear();
    by_id_.clear();
    by_element_.clear();
    by_cell_.clear();
    oversized_.clear();
    bytes_ = 0;
}

auto OperationIndex::contains(std::string_view id) const -> bool {
    return by_id_.find(id) != by_id_.end();
}

auto OperationIndex::find(std::string_view id) const -> const IndexedOperation* {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) return nullptr;
    return &entries_.at(it->second);
}

auto OperationIndex::collect(const std::set<std::uint64_t>& seqs) const
    -> std::vector<const IndexedOperation*> {
    auto result = std::vector<const IndexedOperation*>{};
    result.reserve(seqs.size());
    for (auto seq : seqs) {
        if (auto it = entries_.find(seq); it != entries_.end()) result.push_back(&it->second);
    }
    return result;
}

auto OperationIndex::for_element(std::string_view element_id) const
    -> std::vector<const IndexedOperation*> {
    auto it = by_element_.find(element_id);
    if (it == by_element_.end()) return {};
    return collect(it->second);
}

auto OperationIndex::within(const Rect& region) const -> std::vector<const IndexedOperation*> {
    auto seqs = std::set<std::uint64_t>{};
    if (auto range = cell_range(region, cell_size_)) {
        for (auto cx = range->x0; cx <= range->x1; ++cx) {
            for (auto cy = range->y0; cy <= range->y1; ++cy) {
                if (auto it = by_cell_.find(Cell{cx, cy}); it != by_cell_.end()) {
                    seqs.insert(it->second.begin(), it->second.end());
                }
            }
        }
        seqs.insert(oversized_.begin(), oversized_.end());
    } else {
        // The region itself is too large to rasterize.
        for (const auto& [seq, entry] : entries_) {
            if (!entry.extents.empty()) seqs.insert(seq);
        }
    }

    auto result = std::vector<const IndexedOperation*>{};
    for (const auto* entry : collect(seqs)) {
        if (std::ranges::any_of(entry->extents, [&](const Rect& e) { return touches(e, region); })) {
            result.push_back(entry);
        }
    }
    return result;
}

auto OperationIndex::operations() const -> std::vector<Operation> {
    auto result = std::vector<Operation>{};
    result.reserve(entries_.size());
    for (const auto& [seq, entry] : entries_) result.push_back(entry.operation);
    return result;
}

}  // namespace whiteboard_ot
