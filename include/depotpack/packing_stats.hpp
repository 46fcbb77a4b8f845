#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "depotpack/bin.hpp"
#include "depotpack/fixed.hpp"
#include "depotpack/geometry.hpp"

namespace depotpack {

struct PlacementRecord {
    std::string label;
    Rect rect;
    int count_inner = 0;
    int conflict_category = 0;
};

struct PackingReport {
    Fixed bin_a;
    Fixed bin_b;
    std::optional<bool> feasible;
    std::optional<bool> precheck_passed;
    size_t item_count = 0;
    size_t packed_count = 0;
    int count_inner = 0;
    Fixed a_inner;
    double util_rate = 0.0;
    // Bounding box of the packed items; empty when nothing is packed.
    std::optional<Rect> occupied;
    std::vector<PlacementRecord> placements;
};

PackingReport packing_report(const Bin& bin);

void write_report_json(std::ostream& out, const PackingReport& report, int indent = 0);

}  // namespace depotpack
