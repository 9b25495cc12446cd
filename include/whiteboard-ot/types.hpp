/// @file types.hpp
/// @brief Geometry and time primitives shared by all components.

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <compare>
#include <cstdint>

namespace whiteboard_ot {

/// Milliseconds since the Unix epoch.
using Millis = std::int64_t;

/// Wall-clock time in milliseconds. Advisory only: ordering decisions
/// are made from vector clocks and Lamport timestamps.
inline auto now_millis() -> Millis {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/// A point on the canvas.
struct Point {
    double x{0.0};
    double y{0.0};

    auto operator==(const Point&) const -> bool = default;
};

/// An axis-aligned rectangle on the canvas.
struct Rect {
    double x{0.0};
    double y{0.0};
    double width{0.0};
    double height{0.0};

    auto operator==(const Rect&) const -> bool = default;

    auto right() const -> double { return x + width; }
    auto bottom() const -> double { return y + height; }
    auto area() const -> double { return width * height; }

    /// A zero-sized rectangle at a point.
    static auto at(Point p) -> Rect { return Rect{p.x, p.y, 0.0, 0.0}; }

    /// Grow the rectangle by `margin` on every side.
    auto inflated(double margin) const -> Rect {
        return Rect{x - margin, y - margin, width + 2 * margin, height + 2 * margin};
    }
};

/// Euclidean distance between two points.
inline auto distance(Point a, Point b) -> double {
    return std::hypot(a.x - b.x, a.y - b.y);
}

/// Area of the intersection of two rectangles (0 when disjoint).
inline auto intersection_area(const Rect& a, const Rect& b) -> double {
    const auto left = std::max(a.x, b.x);
    const auto right = std::min(a.right(), b.right());
    const auto top = std::max(a.y, b.y);
    const auto bottom = std::min(a.bottom(), b.bottom());
    if (left < right && top < bottom) {
        return (right - left) * (bottom - top);
    }
    return 0.0;
}

/// Shortest distance between two rectangles (0 when they touch or overlap).
inline auto gap(const Rect& a, const Rect& b) -> double {
    const auto dx = std::max({0.0, a.x - b.right(), b.x - a.right()});
    const auto dy = std::max({0.0, a.y - b.bottom(), b.y - a.bottom()});
    return std::hypot(dx, dy);
}

}  // namespace whiteboard_ot
