#include "depotpack/geometry.hpp"

#include <algorithm>
#include <ostream>

namespace depotpack {

bool fits_into(const Rect& r1, const Rect& r2) {
    return r1.a <= r2.a && r1.b <= r2.b;
}

bool xintersect(const Rect& r1, const Rect& r2) {
    return r1.x_left() < r2.x_right() && r1.x_right() > r2.x_left();
}

bool yintersect(const Rect& r1, const Rect& r2) {
    return r1.y_bottom() < r2.y_top() && r1.y_top() > r2.y_bottom();
}

bool intersect(const Rect& r1, const Rect& r2) {
    return xintersect(r1, r2) && yintersect(r1, r2);
}

bool contains_point(const Rect& r, const Point& p) {
    return r.x_left() <= p.x && p.x <= r.x_right() && r.y_bottom() <= p.y && p.y <= r.y_top();
}

bool contains(const Rect& r1, const Rect& r2) {
    return contains_point(r1, r2.bottom_left()) && contains_point(r1, r2.top_right());
}

Rect bounding_union(const Rect& r1, const Rect& r2) {
    const Fixed min_x = std::min(r1.x_left(), r2.x_left());
    const Fixed min_y = std::min(r1.y_bottom(), r2.y_bottom());
    const Fixed max_x = std::max(r1.x_right(), r2.x_right());
    const Fixed max_y = std::max(r1.y_top(), r2.y_top());
    return Rect(max_x - min_x, max_y - min_y, min_x, min_y);
}

std::ostream& operator<<(std::ostream& os, const Point& p) {
    return os << "(" << p.x << ", " << p.y << ")";
}

std::ostream& operator<<(std::ostream& os, const Rect& r) {
    os << "Rect a=" << r.a << ", b=" << r.b << ", x=" << r.x << ", y=" << r.y;
    if (r.angle != 0) {
        os << ", angle=" << r.angle;
    }
    return os;
}

}  // namespace depotpack
