#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace fm {

struct Point {
    int x = 0;
    int y = 0;
};

// Integer rectangle in either global desktop or screen-local coordinates. Edges are
// computed in 64 bits so any int rectangle is safe to test.
struct Rect {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    std::int64_t right() const { return std::int64_t{x} + w; }
    std::int64_t bottom() const { return std::int64_t{y} + h; }
    std::int64_t center_x() const { return std::int64_t{x} + w / 2; }
    std::int64_t center_y() const { return std::int64_t{y} + h / 2; }
    Point origin() const { return Point{x, y}; }
};

inline Rect make_rect(int x, int y, int w, int h) {
    return Rect{x, y, std::max(0, w), std::max(0, h)};
}

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }
inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

// Half-open containment: the right and bottom edges belong to the neighbour.
inline bool contains(const Rect& r, std::int64_t px, std::int64_t py) {
    return px >= r.x && px < r.right() && py >= r.y && py < r.bottom();
}

inline bool contains(const Rect& r, const Point& p) {
    return contains(r, std::int64_t{p.x}, std::int64_t{p.y});
}

inline bool intersects(const Rect& a, const Rect& b) {
    return a.x < b.right() && b.x < a.right() && a.y < b.bottom() && b.y < a.bottom();
}

// Largest coordinate or extent accepted for a target rectangle.
inline constexpr int kMaxCoordinate = 1 << 30;

inline bool within_coordinate_range(const Rect& r) {
    auto ok = [](int v) { return v >= -kMaxCoordinate && v <= kMaxCoordinate; };
    return ok(r.x) && ok(r.y) && ok(r.w) && ok(r.h);
}

struct ScreenGeometry {
    int id = 0;
    std::string name;
    Rect bounds{};
    bool primary = false;
};

} // namespace fm
