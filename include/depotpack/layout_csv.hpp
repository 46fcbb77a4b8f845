#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "depotpack/area.hpp"
#include "depotpack/area_kinds.hpp"
#include "depotpack/bin.hpp"
#include "depotpack/fixed.hpp"

namespace depotpack {

// One line of a layout file:
//   <kind>,<capacity>[,<angle>]   depot area of kind L|DSR|DSR_90|DDR,
//                                 angle only for DSR and DSR_90
//   rect,<a>,<b>                  bare rectangle
struct LayoutEntry {
    bool is_rect = false;
    AreaKind kind = AreaKind::kLine;
    int capacity = 0;
    std::optional<int> angle;
    Fixed a;
    Fixed b;
    int line_no = 0;
};

// Blank lines, '#' comments and an optional "type,..." header are skipped.
// Throws std::runtime_error naming the line on malformed input.
std::vector<LayoutEntry> read_layout_csv(std::istream& in);

Area make_layout_area(const LayoutEntry& entry, const VehicleParameters& params);

// Reads a layout file and appends its areas to bin.
void load_layout(std::istream& in, Bin& bin, const VehicleParameters& params);

// index,type,x,y,a,b,count_inner for every packed item.
void write_placements_csv(std::ostream& out, const Bin& bin);

}  // namespace depotpack
