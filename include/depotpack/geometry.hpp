#pragma once

#include <iosfwd>

#include "depotpack/fixed.hpp"

namespace depotpack {

struct Point {
    Fixed x;
    Fixed y;
};

inline bool operator==(const Point& l, const Point& r) { return l.x == r.x && l.y == r.y; }
inline bool operator!=(const Point& l, const Point& r) { return !(l == r); }

// Rectangle with width a, height b and bottom-left corner (x, y) of its
// unrotated bounding box. angle is carried for drawing only; every predicate
// below treats rectangles as unrotated.
struct Rect {
    Fixed a;
    Fixed b;
    Fixed x;
    Fixed y;
    int angle = 0;

    Rect() = default;
    Rect(Fixed a_, Fixed b_, Fixed x_ = Fixed(), Fixed y_ = Fixed(), int angle_ = 0)
        : a(a_), b(b_), x(x_), y(y_), angle(angle_) {}

    Fixed x_left() const { return x; }
    Fixed x_right() const { return x + a; }
    Fixed y_bottom() const { return y; }
    Fixed y_top() const { return y + b; }

    Point bottom_left() const { return Point{x, y}; }
    Point top_right() const { return Point{x + a, y + b}; }
    Point center() const { return Point{x + a / 2, y + b / 2}; }

    Fixed area() const { return a * b; }
};

inline bool operator==(const Rect& l, const Rect& r) {
    return l.a == r.a && l.b == r.b && l.x == r.x && l.y == r.y && l.angle == r.angle;
}
inline bool operator!=(const Rect& l, const Rect& r) { return !(l == r); }

// r1 is smaller than or equal to r2 in both dimensions.
bool fits_into(const Rect& r1, const Rect& r2);

// Strict overlap along one axis. Touching edges are not an intersection.
bool xintersect(const Rect& r1, const Rect& r2);
bool yintersect(const Rect& r1, const Rect& r2);
bool intersect(const Rect& r1, const Rect& r2);

// r1 encloses r2 (boundaries included).
bool contains(const Rect& r1, const Rect& r2);
bool contains_point(const Rect& r, const Point& p);

// Smallest rectangle enclosing both.
Rect bounding_union(const Rect& r1, const Rect& r2);

std::ostream& operator<<(std::ostream& os, const Point& p);
std::ostream& operator<<(std::ostream& os, const Rect& r);

}  // namespace depotpack
