#pragma once

#include <array>
#include <optional>
#include <string>

#include "depotpack/area.hpp"
#include "depotpack/bin_with_distances.hpp"
#include "depotpack/fixed.hpp"

namespace depotpack {

// Depot area types.
enum class AreaKind {
    kLine = 0,               // vehicles parked one behind another
    kDirectSingleRow = 1,    // one row of angled slots, entry from the left
    kDirectSingleRow90 = 2,  // mirrored single row, entry from the right
    kDirectDoubleRow = 3,    // two interleaved rows of angled slots
};

constexpr std::array<AreaKind, 4> kAllAreaKinds{
    AreaKind::kLine,
    AreaKind::kDirectSingleRow,
    AreaKind::kDirectSingleRow90,
    AreaKind::kDirectDoubleRow,
};

// Slot sizes and clearances for one vehicle type. All lengths in meters.
struct VehicleParameters {
    Fixed width_safe = Fixed::parse("3.55");
    Fixed length_safe = Fixed::parse("12.5");
    int direct_angle = 45;
    Fixed direct_distance_a = 8;
    Fixed direct_distance_b = 0;
    Fixed line_distance_a = 0;
    Fixed line_distance_b = Fixed::parse("19.25");
    Fixed edge_distance_a = 8;
    Fixed edge_distance_b = 15;
};

// 12 m standard bus.
VehicleParameters standard_bus_parameters();
// 18 m articulated bus.
VehicleParameters articulated_bus_parameters();
// "sb" or "ab".
VehicleParameters vehicle_parameters(const std::string& name);

// Short names used in files and on the command line: L, DSR, DSR_90, DDR.
const char* area_kind_name(AreaKind kind);
AreaKind parse_area_kind(const std::string& name);

AreaShape area_kind_shape(AreaKind kind);
int area_kind_conflict_category(AreaKind kind);
int area_kind_capacity_min(AreaKind kind);
Buffers area_kind_buffers(AreaKind kind, const VehicleParameters& params);

// Builds an area of the given kind. angle overrides the direct angle of the
// single row kinds (its sign is taken from the kind). Other kinds reject it.
Area make_area(AreaKind kind,
               int capacity,
               const VehicleParameters& params = {},
               std::optional<int> angle = std::nullopt);

EdgeClearance edge_clearance(const VehicleParameters& params);

}  // namespace depotpack
