/// @file operation_index.hpp
/// @brief Arrival-ordered operation store with element and spatial indexes.

#pragma once

#include <whiteboard-ot/operation.hpp>
#include <whiteboard-ot/types.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace whiteboard_ot {

/// A stored operation together with its derived lookup keys.
struct IndexedOperation {
    std::uint64_t seq{0};                          ///< Arrival sequence number.
    Operation operation;                           ///< The operation as stored.
    std::vector<Operation> parts;                  ///< expand_operation(operation).
    std::vector<std::string> elements;             ///< Touched element ids.
    std::vector<Rect> extents;                     ///< Extents of the geometric parts.
    std::vector<std::pair<std::int64_t, std::int64_t>> cells;  ///< Grid cells covered.
    bool oversized{false};                         ///< Extent too large to grid.
    std::size_t bytes{0};                          ///< Approximate memory footprint.
};

/// Operations in arrival order, indexed by id, element id and a uniform
/// spatial grid.
///
/// Lookups by element and by region touch only the matching entries, so
/// a candidate search stays proportional to the number of nearby
/// operations rather than to the size of the store.
class OperationIndex {
public:
    /// @param cell_size Edge length of a grid cell in canvas units.
    explicit OperationIndex(double cell_size = 100.0);

    /// Append an operation. An operation with the same id is replaced
    /// and moves to the back.
    void insert(const Operation& op);

    /// Remove by id. Returns false when absent.
    auto erase(std::string_view id) -> bool;

    /// Remove and return the oldest operation.
    auto pop_front() -> std::optional<Operation>;

    void clear();

    auto contains(std::string_view id) const -> bool;
    auto find(std::string_view id) const -> const IndexedOperation*;

    /// Entries touching an element, in arrival order.
    auto for_element(std::string_view element_id) const -> std::vector<const IndexedOperation*>;

    /// Entries whose extent intersects `region`, in arrival order.
    auto within(const Rect& region) const -> std::vector<const IndexedOperation*>;

    /// Every stored operation in arrival order.
    auto operations() const -> std::vector<Operation>;

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto cell_size() const -> double { return cell_size_; }

    /// Sum of the approximate footprints of all entries.
    auto approximate_bytes() const -> std::size_t { return bytes_; }

private:
    using Cell = std::pair<std::int64_t, std::int64_t>;

    struct CellHash {
        auto operator()(const Cell& c) const noexcept -> std::size_t {
            return std::hash<std::int64_t>{}(c.first) * 31u ^ std::hash<std::int64_t>{}(c.second);
        }
    };

    void unlink(const IndexedOperation& entry);
    auto collect(const std::set<std::uint64_t>& seqs) const -> std::vector<const IndexedOperation*>;

    double cell_size_;
    std::uint64_t next_seq_{0};
    std::size_t bytes_{0};
    std::map<std::uint64_t, IndexedOperation> entries_;
    std::map<std::string, std::uint64_t, std::less<>> by_id_;
    std::map<std::string, std::set<std::uint64_t>, std::less<>> by_element_;
    std::unordered_map<Cell, std::set<std::uint64_t>, CellHash> by_cell_;
    std::set<std::uint64_t> oversized_;
};

}  // namespace whiteboard_ot
