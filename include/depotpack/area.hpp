#pragma once

#include <array>
#include <string>
#include <utility>

#include "depotpack/fixed.hpp"
#include "depotpack/geometry.hpp"

namespace depotpack {

enum class AreaShape {
    kPlain = 0,             // bare rectangle without slots
    kStacked = 1,           // slots stacked in +y, unrotated
    kRotatableRow = 2,      // one row of slots rotated by angle_inner
    kRotatedDoubleRow = 3,  // two interleaved rows at +45/+135 degrees
};

const char* area_shape_name(AreaShape shape);

enum class Side {
    kLeft = 0,
    kBottom = 1,
    kRight = 2,
    kTop = 3,
};

constexpr std::array<Side, 4> kAllSides{Side::kLeft, Side::kBottom, Side::kRight, Side::kTop};

// Buffer depth per side. Zero disables a side.
struct Buffers {
    Fixed left;
    Fixed bottom;
    Fixed right;
    Fixed top;

    Fixed depth(Side side) const;
};

constexpr int kMaxInnerAngle = 75;
constexpr int kDoubleRowAngle = 45;

// Outer box and slot layout derived from the shape parameters. Offsets are
// relative to the area's bottom-left corner.
struct ShapeGeometry {
    Fixed a;
    Fixed b;
    Fixed pitch;  // y distance between consecutive slots of one row
    Point first_slot;   // anchor of slot 0
    Point second_row;   // anchor of slot 1 (double row only)
};

// Throws std::invalid_argument on sizes <= 0, a slot count below the shape's
// minimum or an angle outside [-75, 75].
ShapeGeometry shape_geometry(AreaShape shape, Fixed m, Fixed n, int count_inner, int angle_inner);

// Smallest slot count accepted by a shape (0 for kPlain).
int min_count_inner(AreaShape shape);

// A depot area being packed: outer bounding box at (x, y), inner slots and
// four buffer zones. Only x and y change after construction; slot anchors and
// buffer rectangles are computed from them on every call.
class Area {
public:
    static Area plain(Fixed a, Fixed b, const Buffers& buffers = {}, int conflict_category = 0);
    static Area stacked(Fixed m, Fixed n, int count_inner, const Buffers& buffers = {}, int conflict_category = 0);
    static Area rotatable_row(Fixed m,
                              Fixed n,
                              int count_inner,
                              int angle_inner,
                              const Buffers& buffers = {},
                              int conflict_category = 0);
    static Area rotated_double_row(Fixed m,
                                   Fixed n,
                                   int count_inner,
                                   const Buffers& buffers = {},
                                   int conflict_category = 0);

    AreaShape shape() const { return shape_; }
    int conflict_category() const { return conflict_category_; }

    // Free-form tag used in reports and drawings (e.g. "DSR").
    const std::string& label() const { return label_; }
    void set_label(std::string label) { label_ = std::move(label); }

    Fixed x() const { return x_; }
    Fixed y() const { return y_; }
    void set_x(Fixed x) { x_ = x; }
    void set_y(Fixed y) { y_ = y; }
    void set_position(Fixed x, Fixed y) {
        x_ = x;
        y_ = y;
    }

    Fixed a() const { return geo_.a; }
    Fixed b() const { return geo_.b; }
    Fixed area() const { return geo_.a * geo_.b; }
    Rect rect() const { return Rect(geo_.a, geo_.b, x_, y_); }

    // Slots.
    int count_inner() const { return count_inner_; }
    Fixed slot_a() const { return m_; }
    Fixed slot_b() const { return n_; }
    int angle_inner() const { return angle_inner_; }
    Fixed pitch() const { return geo_.pitch; }
    Point slot_position(int index) const;
    int slot_angle(int index) const;
    // Slot rectangle anchored at its rotation origin, angle set for drawing.
    Rect slot_rect(int index) const;
    Fixed inner_area() const { return m_ * n_ * count_inner_; }
    double utilization_rate() const;

    // Buffers.
    const Buffers& buffers() const { return buffers_; }
    Fixed buffer_depth(Side side) const { return buffers_.depth(side); }
    Rect buffer_rect(Side side) const;
    Fixed a_with_distances() const { return buffers_.left + geo_.a + buffers_.right; }
    Fixed b_with_distances() const { return buffers_.bottom + geo_.b + buffers_.top; }
    Fixed x_with_distances() const { return x_ - buffers_.left; }
    Fixed y_with_distances() const { return y_ - buffers_.bottom; }
    Fixed area_distances() const;
    Fixed area_with_distances() const { return area() + area_distances(); }
    double utilization_rate_with_distances() const;

private:
    Area(AreaShape shape,
         Fixed m,
         Fixed n,
         int count_inner,
         int angle_inner,
         const Buffers& buffers,
         int conflict_category);

    AreaShape shape_ = AreaShape::kPlain;
    Fixed m_;
    Fixed n_;
    int count_inner_ = 0;
    int angle_inner_ = 0;
    ShapeGeometry geo_;
    Buffers buffers_;
    int conflict_category_ = 0;
    std::string label_;

    Fixed x_;
    Fixed y_;
};

}  // namespace depotpack
