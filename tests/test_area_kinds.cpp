#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "depotpack/area_kinds.hpp"

using depotpack::AreaKind;
using depotpack::AreaShape;
using depotpack::Fixed;
using depotpack::Side;

TEST(AreaKinds, NamesRoundTrip) {
    for (const AreaKind k : depotpack::kAllAreaKinds) {
        EXPECT_EQ(depotpack::parse_area_kind(depotpack::area_kind_name(k)), k);
    }
    EXPECT_STREQ(depotpack::area_kind_name(AreaKind::kDirectSingleRow90), "DSR_90");
    EXPECT_THROW(depotpack::parse_area_kind("XYZ"), std::invalid_argument);
}

TEST(AreaKinds, ConflictCategoriesOrderPacking) {
    EXPECT_EQ(depotpack::area_kind_conflict_category(AreaKind::kDirectDoubleRow), 4);
    EXPECT_EQ(depotpack::area_kind_conflict_category(AreaKind::kDirectSingleRow), 3);
    EXPECT_EQ(depotpack::area_kind_conflict_category(AreaKind::kLine), 2);
    EXPECT_EQ(depotpack::area_kind_conflict_category(AreaKind::kDirectSingleRow90), 1);
}

TEST(AreaKinds, MinimumCapacities) {
    EXPECT_EQ(depotpack::area_kind_capacity_min(AreaKind::kLine), 2);
    EXPECT_EQ(depotpack::area_kind_capacity_min(AreaKind::kDirectSingleRow), 1);
    EXPECT_EQ(depotpack::area_kind_capacity_min(AreaKind::kDirectSingleRow90), 1);
    EXPECT_EQ(depotpack::area_kind_capacity_min(AreaKind::kDirectDoubleRow), 2);
}

TEST(AreaKinds, LineAreaUsesUnrotatedSlots) {
    const auto params = depotpack::standard_bus_parameters();
    const auto area = depotpack::make_area(AreaKind::kLine, 3, params);
    EXPECT_EQ(area.shape(), AreaShape::kStacked);
    EXPECT_EQ(area.label(), "L");
    EXPECT_EQ(area.a(), Fixed::parse("3.55"));
    EXPECT_EQ(area.b(), Fixed::parse("37.5"));
    EXPECT_EQ(area.buffer_depth(Side::kLeft), Fixed());
    EXPECT_EQ(area.buffer_depth(Side::kTop), Fixed::parse("19.25"));
    EXPECT_EQ(area.conflict_category(), 2);
}

TEST(AreaKinds, SingleRowsAreMirrored) {
    const auto params = depotpack::standard_bus_parameters();
    const auto dsr = depotpack::make_area(AreaKind::kDirectSingleRow, 4, params);
    const auto dsr90 = depotpack::make_area(AreaKind::kDirectSingleRow90, 4, params);
    EXPECT_EQ(dsr.angle_inner(), 45);
    EXPECT_EQ(dsr90.angle_inner(), -45);
    EXPECT_EQ(dsr.a(), dsr90.a());
    EXPECT_EQ(dsr.buffer_depth(Side::kLeft), Fixed(8));
    EXPECT_EQ(dsr.buffer_depth(Side::kRight), Fixed());
    EXPECT_EQ(dsr90.buffer_depth(Side::kLeft), Fixed());
    EXPECT_EQ(dsr90.buffer_depth(Side::kRight), Fixed(8));
}

TEST(AreaKinds, AngleOverrideKeepsKindSign) {
    const auto params = depotpack::standard_bus_parameters();
    EXPECT_EQ(depotpack::make_area(AreaKind::kDirectSingleRow, 1, params, 60).angle_inner(), 60);
    EXPECT_EQ(depotpack::make_area(AreaKind::kDirectSingleRow90, 1, params, 60).angle_inner(), -60);
    EXPECT_THROW(depotpack::make_area(AreaKind::kDirectSingleRow, 1, params, 80), std::invalid_argument);
}

TEST(AreaKinds, AngleRejectedForFixedAngleKinds) {
    const auto params = depotpack::standard_bus_parameters();
    EXPECT_THROW(depotpack::make_area(AreaKind::kLine, 2, params, 30), std::invalid_argument);
    EXPECT_THROW(depotpack::make_area(AreaKind::kDirectDoubleRow, 2, params, 30), std::invalid_argument);
    EXPECT_NO_THROW(depotpack::make_area(AreaKind::kDirectDoubleRow, 2, params));
}

TEST(AreaKinds, DoubleRowBuffersOnBothSides) {
    const auto area = depotpack::make_area(AreaKind::kDirectDoubleRow, 6);
    EXPECT_EQ(area.shape(), AreaShape::kRotatedDoubleRow);
    EXPECT_EQ(area.buffer_depth(Side::kLeft), Fixed(8));
    EXPECT_EQ(area.buffer_depth(Side::kRight), Fixed(8));
    EXPECT_EQ(area.count_inner(), 6);
    EXPECT_THROW(depotpack::make_area(AreaKind::kDirectDoubleRow, 1), std::invalid_argument);
}

TEST(AreaKinds, VehicleParameterSets) {
    const auto sb = depotpack::vehicle_parameters("sb");
    const auto ab = depotpack::vehicle_parameters("ab");
    EXPECT_EQ(sb.length_safe, Fixed::parse("12.5"));
    EXPECT_EQ(ab.length_safe, Fixed::parse("18.5"));
    EXPECT_EQ(ab.direct_distance_a, Fixed(10));
    EXPECT_EQ(ab.width_safe, sb.width_safe);
    EXPECT_THROW(depotpack::vehicle_parameters("tram"), std::invalid_argument);

    const auto ab_area = depotpack::make_area(AreaKind::kLine, 2, ab);
    EXPECT_EQ(ab_area.b(), Fixed(37));
}

TEST(AreaKinds, EdgeClearanceFromParameters) {
    const auto c = depotpack::edge_clearance(depotpack::standard_bus_parameters());
    EXPECT_EQ(c.left, Fixed(8));
    EXPECT_EQ(c.right, Fixed(8));
    EXPECT_EQ(c.bottom, Fixed(15));
    EXPECT_EQ(c.top, Fixed(15));
}
