#include "depotpack/area_kinds.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace depotpack {

VehicleParameters standard_bus_parameters() {
    return VehicleParameters{};
}

VehicleParameters articulated_bus_parameters() {
    VehicleParameters p;
    p.length_safe = Fixed::parse("18.5");
    p.direct_distance_a = 10;
    return p;
}

VehicleParameters vehicle_parameters(const std::string& name) {
    if (name == "sb") {
        return standard_bus_parameters();
    }
    if (name == "ab") {
        return articulated_bus_parameters();
    }
    throw std::invalid_argument("vehicle_parameters: unknown vehicle type '" + name + "' (use sb|ab)");
}

const char* area_kind_name(AreaKind kind) {
    switch (kind) {
        case AreaKind::kLine:
            return "L";
        case AreaKind::kDirectSingleRow:
            return "DSR";
        case AreaKind::kDirectSingleRow90:
            return "DSR_90";
        case AreaKind::kDirectDoubleRow:
            return "DDR";
    }
    return "unknown";
}

AreaKind parse_area_kind(const std::string& name) {
    for (const AreaKind k : kAllAreaKinds) {
        if (name == area_kind_name(k)) {
            return k;
        }
    }
    throw std::invalid_argument("parse_area_kind: unknown area kind '" + name + "' (use L|DSR|DSR_90|DDR)");
}

AreaShape area_kind_shape(AreaKind kind) {
    switch (kind) {
        case AreaKind::kLine:
            return AreaShape::kStacked;
        case AreaKind::kDirectSingleRow:
        case AreaKind::kDirectSingleRow90:
            return AreaShape::kRotatableRow;
        case AreaKind::kDirectDoubleRow:
            return AreaShape::kRotatedDoubleRow;
    }
    throw std::invalid_argument("area_kind_shape: invalid kind");
}

int area_kind_conflict_category(AreaKind kind) {
    switch (kind) {
        case AreaKind::kLine:
            return 2;
        case AreaKind::kDirectSingleRow:
            return 3;
        case AreaKind::kDirectSingleRow90:
            return 1;
        case AreaKind::kDirectDoubleRow:
            return 4;
    }
    return 0;
}

int area_kind_capacity_min(AreaKind kind) {
    return min_count_inner(area_kind_shape(kind));
}

Buffers area_kind_buffers(AreaKind kind, const VehicleParameters& params) {
    const Fixed da = params.direct_distance_a;
    const Fixed db = params.direct_distance_b;
    switch (kind) {
        case AreaKind::kLine:
            return Buffers{params.line_distance_a, params.line_distance_b, params.line_distance_a,
                           params.line_distance_b};
        case AreaKind::kDirectSingleRow:
            return Buffers{da, db, Fixed(), db};
        case AreaKind::kDirectSingleRow90:
            return Buffers{Fixed(), db, da, db};
        case AreaKind::kDirectDoubleRow:
            return Buffers{da, db, da, db};
    }
    throw std::invalid_argument("area_kind_buffers: invalid kind");
}

Area make_area(AreaKind kind, int capacity, const VehicleParameters& params, std::optional<int> angle) {
    const Buffers buffers = area_kind_buffers(kind, params);
    const int category = area_kind_conflict_category(kind);
    if (angle && area_kind_shape(kind) != AreaShape::kRotatableRow) {
        throw std::invalid_argument(std::string("make_area: angle applies to single row kinds only, not ") +
                                    area_kind_name(kind));
    }
    const int base_angle = angle ? std::abs(*angle) : params.direct_angle;

    switch (kind) {
        case AreaKind::kLine: {
            Area area = Area::stacked(params.width_safe, params.length_safe, capacity, buffers, category);
            area.set_label(area_kind_name(kind));
            return area;
        }
        case AreaKind::kDirectSingleRow: {
            Area area =
                Area::rotatable_row(params.length_safe, params.width_safe, capacity, base_angle, buffers, category);
            area.set_label(area_kind_name(kind));
            return area;
        }
        case AreaKind::kDirectSingleRow90: {
            Area area =
                Area::rotatable_row(params.length_safe, params.width_safe, capacity, -base_angle, buffers, category);
            area.set_label(area_kind_name(kind));
            return area;
        }
        case AreaKind::kDirectDoubleRow: {
            Area area = Area::rotated_double_row(params.length_safe, params.width_safe, capacity, buffers, category);
            area.set_label(area_kind_name(kind));
            return area;
        }
    }
    throw std::invalid_argument("make_area: invalid kind");
}

EdgeClearance edge_clearance(const VehicleParameters& params) {
    EdgeClearance c;
    c.left = params.edge_distance_a;
    c.right = params.edge_distance_a;
    c.bottom = params.edge_distance_b;
    c.top = params.edge_distance_b;
    return c;
}

}  // namespace depotpack
