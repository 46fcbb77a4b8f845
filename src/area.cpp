#include "depotpack/area.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace depotpack {
namespace {

constexpr double kPi = 3.14159265358979323846;

struct Trig {
    Fixed sin;
    Fixed cos;
};

// sin/cos quantized to the fixed-point grid so every projection below is
// reproducible.
Trig trig_deg(int deg) {
    const double rad = static_cast<double>(deg) * (kPi / 180.0);
    return Trig{Fixed::from_double(std::sin(rad)), Fixed::from_double(std::cos(rad))};
}

void validate_size(Fixed m, Fixed n, const char* fn) {
    if (!(m > Fixed()) || !(n > Fixed())) {
        throw std::invalid_argument(std::string(fn) + ": sizes must be > 0");
    }
}

void validate_buffers(const Buffers& b) {
    for (const Side s : kAllSides) {
        if (b.depth(s) < Fixed()) {
            throw std::invalid_argument("Area: buffer depths must be >= 0");
        }
    }
}

}  // namespace

const char* area_shape_name(AreaShape shape) {
    switch (shape) {
        case AreaShape::kPlain:
            return "plain";
        case AreaShape::kStacked:
            return "stacked";
        case AreaShape::kRotatableRow:
            return "rotatable_row";
        case AreaShape::kRotatedDoubleRow:
            return "rotated_double_row";
    }
    return "unknown";
}

Fixed Buffers::depth(Side side) const {
    switch (side) {
        case Side::kLeft:
            return left;
        case Side::kBottom:
            return bottom;
        case Side::kRight:
            return right;
        case Side::kTop:
            return top;
    }
    return Fixed();
}

int min_count_inner(AreaShape shape) {
    switch (shape) {
        case AreaShape::kPlain:
            return 0;
        case AreaShape::kStacked:
            return 2;
        case AreaShape::kRotatableRow:
            return 1;
        case AreaShape::kRotatedDoubleRow:
            return 2;
    }
    return 0;
}

ShapeGeometry shape_geometry(AreaShape shape, Fixed m, Fixed n, int count_inner, int angle_inner) {
    validate_size(m, n, "shape_geometry");
    if (count_inner < min_count_inner(shape)) {
        throw std::invalid_argument("shape_geometry: count_inner must be >= " +
                                    std::to_string(min_count_inner(shape)) + " for " + area_shape_name(shape));
    }

    ShapeGeometry g;
    switch (shape) {
        case AreaShape::kPlain: {
            g.a = m;
            g.b = n;
            g.pitch = n;
            break;
        }
        case AreaShape::kStacked: {
            g.a = m;
            g.b = n * count_inner;
            g.pitch = n;
            break;
        }
        case AreaShape::kRotatableRow: {
            if (angle_inner < -kMaxInnerAngle || angle_inner > kMaxInnerAngle) {
                throw std::invalid_argument("shape_geometry: angle_inner must be in [-75, 75]");
            }
            // Projections of the rotated slot onto the axes. For negative
            // angles sin < 0, so PA and DS change sign.
            const Trig t = trig_deg(angle_inner);
            const Fixed pa = n * t.sin;
            const Fixed aq = m * t.cos;
            const Fixed pd = n * t.cos;
            const Fixed ds = m * t.sin;
            g.pitch = n / t.cos;
            if (angle_inner < 0) {
                g.a = aq - pa;
                g.b = pd - ds + g.pitch * (count_inner - 1);
                g.first_slot = Point{Fixed(), -ds};
            } else {
                g.a = pa + aq;
                g.b = pd + ds + g.pitch * (count_inner - 1);
                g.first_slot = Point{pa, Fixed()};
            }
            break;
        }
        case AreaShape::kRotatedDoubleRow: {
            const Trig t = trig_deg(kDoubleRowAngle);
            const Fixed pa = n * t.sin;
            const Fixed abx = m * t.cos;
            const Fixed pd = n * t.cos;
            const Fixed ds = m * t.sin;
            g.pitch = n / t.cos;
            g.a = pa + abx * 2;
            // Columns are offset by half a pitch: each extra slot adds h / 2.
            g.b = pd + ds + (g.pitch * (count_inner - 1)) / 2;
            g.first_slot = Point{pa, Fixed()};
            g.second_row = Point{g.a, g.pitch};
            break;
        }
    }
    return g;
}

Area::Area(AreaShape shape,
           Fixed m,
           Fixed n,
           int count_inner,
           int angle_inner,
           const Buffers& buffers,
           int conflict_category)
    : shape_(shape),
      m_(m),
      n_(n),
      count_inner_(count_inner),
      angle_inner_(angle_inner),
      geo_(shape_geometry(shape, m, n, count_inner, angle_inner)),
      buffers_(buffers),
      conflict_category_(conflict_category),
      label_(),
      x_(),
      y_() {
    validate_buffers(buffers_);
}

Area Area::plain(Fixed a, Fixed b, const Buffers& buffers, int conflict_category) {
    return Area(AreaShape::kPlain, a, b, 0, 0, buffers, conflict_category);
}

Area Area::stacked(Fixed m, Fixed n, int count_inner, const Buffers& buffers, int conflict_category) {
    return Area(AreaShape::kStacked, m, n, count_inner, 0, buffers, conflict_category);
}

Area Area::rotatable_row(Fixed m,
                         Fixed n,
                         int count_inner,
                         int angle_inner,
                         const Buffers& buffers,
                         int conflict_category) {
    return Area(AreaShape::kRotatableRow, m, n, count_inner, angle_inner, buffers, conflict_category);
}

Area Area::rotated_double_row(Fixed m, Fixed n, int count_inner, const Buffers& buffers, int conflict_category) {
    return Area(AreaShape::kRotatedDoubleRow, m, n, count_inner, kDoubleRowAngle, buffers, conflict_category);
}

Point Area::slot_position(int index) const {
    if (index < 0 || index >= count_inner_) {
        throw std::out_of_range("Area::slot_position: index out of range");
    }
    switch (shape_) {
        case AreaShape::kPlain:
            break;
        case AreaShape::kStacked:
        case AreaShape::kRotatableRow:
            return Point{x_ + geo_.first_slot.x, y_ + geo_.first_slot.y + geo_.pitch * index};
        case AreaShape::kRotatedDoubleRow:
            if (index % 2 != 0) {
                return Point{x_ + geo_.second_row.x, y_ + geo_.second_row.y + geo_.pitch * ((index - 1) / 2)};
            }
            return Point{x_ + geo_.first_slot.x, y_ + geo_.first_slot.y + geo_.pitch * (index / 2)};
    }
    throw std::out_of_range("Area::slot_position: plain areas have no slots");
}

int Area::slot_angle(int index) const {
    if (index < 0 || index >= count_inner_) {
        throw std::out_of_range("Area::slot_angle: index out of range");
    }
    if (shape_ == AreaShape::kRotatedDoubleRow) {
        return (index % 2 != 0) ? 180 - kDoubleRowAngle : kDoubleRowAngle;
    }
    return angle_inner_;
}

Rect Area::slot_rect(int index) const {
    const Point p = slot_position(index);
    return Rect(m_, n_, p.x, p.y, slot_angle(index));
}

double Area::utilization_rate() const {
    return ratio(inner_area(), area());
}

Rect Area::buffer_rect(Side side) const {
    switch (side) {
        case Side::kLeft:
            return Rect(buffers_.left, geo_.b, x_ - buffers_.left, y_);
        case Side::kBottom:
            return Rect(geo_.a, buffers_.bottom, x_, y_ - buffers_.bottom);
        case Side::kRight:
            return Rect(buffers_.right, geo_.b, x_ + geo_.a, y_);
        case Side::kTop:
            return Rect(geo_.a, buffers_.top, x_, y_ + geo_.b);
    }
    throw std::invalid_argument("Area::buffer_rect: invalid side");
}

Fixed Area::area_distances() const {
    Fixed total;
    for (const Side s : kAllSides) {
        total += buffer_rect(s).area();
    }
    return total;
}

double Area::utilization_rate_with_distances() const {
    return ratio(inner_area(), area_with_distances());
}

}  // namespace depotpack
