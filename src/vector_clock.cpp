#include <whiteboard-ot/vector_clock.hpp>

#include <algorithm>

namespace whiteboard_ot {

auto compare(const VectorClock& a, const VectorClock& b) -> Causality {
    auto a_less = false;     // some entry of a is below b's
    auto a_greater = false;  // some entry of a is above b's

    // Both maps are sorted by user id: walk them together, treating a
    // missing entry as 0.
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() || ib != b.end()) {
        auto va = std::uint64_t{0};
        auto vb = std::uint64_t{0};
        if (ib == b.end() || (ia != a.end() && ia->first < ib->first)) {
            va = ia->second;
            ++ia;
        } else if (ia == a.end() || ib->first < ia->first) {
            vb = ib->second;
            ++ib;
        } else {
            va = ia->second;
            vb = ib->second;
            ++ia;
            ++ib;
        }
        if (va < vb) a_less = true;
        if (va > vb) a_greater = true;
        if (a_less && a_greater) return Causality::concurrent;
    }

    if (a_less) return Causality::before;
    if (a_greater) return Causality::after;
    return Causality::concurrent;
}

auto advance_clock(VectorClock clock, std::string_view user_id) -> VectorClock {
    auto it = clock.find(user_id);
    if (it == clock.end()) {
        clock.emplace(std::string{user_id}, 1);
    } else {
        ++it->second;
    }
    return clock;
}

void merge_into(VectorClock& into, const VectorClock& other) {
    for (const auto& [user, counter] : other) {
        auto it = into.find(user);
        if (it == into.end()) {
            into.emplace(user, counter);
        } else {
            it->second = std::max(it->second, counter);
        }
    }
}

auto merge(const VectorClock& a, const VectorClock& b) -> VectorClock {
    auto result = a;
    merge_into(result, b);
    return result;
}

auto divergence(const VectorClock& a, const VectorClock& b) -> std::size_t {
    if (compare(a, b) != Causality::concurrent) return 0;

    auto differing = std::size_t{0};
    for (const auto& [user, counter] : a) {
        if (counter_of(b, user) != counter) ++differing;
    }
    for (const auto& [user, counter] : b) {
        if (!a.contains(user) && counter != 0) ++differing;
    }
    return differing;
}

}  // namespace whiteboard_ot
