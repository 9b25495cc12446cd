/// @file lru_cache.hpp
/// @brief A small bounded least-recently-used map.

#pragma once

#include <cstddef>
#include <list>
#include <unordered_map>
#include <utility>

namespace whiteboard_ot {

/// Bounded map evicting the least recently used entry on overflow.
///
/// Copyable, so that a context holding one can be snapshotted.
template <typename Key, typename Value>
class LruCache {
public:
    explicit LruCache(std::size_t capacity = 5000) : capacity_{capacity} {}

    LruCache(const LruCache& other) : capacity_{other.capacity_}, order_{other.order_} {
        reindex();
    }

    auto operator=(const LruCache& other) -> LruCache& {
        if (this != &other) {
            capacity_ = other.capacity_;
            order_ = other.order_;
            reindex();
        }
        return *this;
    }

    LruCache(LruCache&&) noexcept = default;
    auto operator=(LruCache&&) noexcept -> LruCache& = default;

    /// Look up and mark as recently used.
    auto get(const Key& key) -> const Value* {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        order_.splice(order_.begin(), order_, it->second);
        return &it->second->second;
    }

    auto contains(const Key& key) const -> bool { return index_.contains(key); }

    void put(Key key, Value value) {
        if (auto it = index_.find(key); it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }
        if (capacity_ == 0) return;
        order_.emplace_front(key, std::move(value));
        index_.emplace(std::move(key), order_.begin());
        while (order_.size() > capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
        }
    }

    void clear() {
        index_.clear();
        order_.clear();
    }

    auto size() const -> std::size_t { return order_.size(); }
    auto capacity() const -> std::size_t { return capacity_; }

private:
    using Entry = std::pair<Key, Value>;

    void reindex() {
        index_.clear();
        for (auto it = order_.begin(); it != order_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    std::size_t capacity_;
    std::list<Entry> order_;
    std::unordered_map<Key, typename std::list<Entry>::iterator> index_;
};

}  // namespace whiteboard_ot
