#pragma once

#include <functional>
#include <memory>
#include <optional>

#include "depotpack/area.hpp"
#include "depotpack/area_kinds.hpp"
#include "depotpack/bin.hpp"
#include "depotpack/bin_with_distances.hpp"
#include "depotpack/fixed.hpp"

namespace depotpack {

// Depot plot the probes pack into.
struct PlotSpec {
    Fixed a = 150;
    Fixed b = 150;
    bool with_distances = true;
    EdgeClearance clearance;
};

// Fresh empty bin for plot (BinWithDistances unless with_distances is off).
std::unique_ptr<Bin> make_bin(const PlotSpec& plot, bool record_history = false);

// Builds one area with the given capacity.
using CapacityFactory = std::function<Area(int capacity)>;
// Builds one more identical area.
using AreaFactory = std::function<Area()>;

constexpr int kDefaultProbeLimit = 200;

// Largest capacity in [capacity_min, limit] whose area alone finds a place
// in an empty bin (placement search only, no full packing). Empty if not
// even capacity_min fits. Throws std::runtime_error if limit still fits.
std::optional<int> capacity_max(const CapacityFactory& factory,
                                int capacity_min,
                                const PlotSpec& plot,
                                int limit = kDefaultProbeLimit);

struct CountMaxResult {
    std::optional<int> count;  // empty if not even one area fits
    std::unique_ptr<Bin> bin;  // packed with count areas (or the failed single area)
};

// Adds areas one at a time and repacks until the layout becomes infeasible.
// Throws std::runtime_error if more than limit areas fit.
CountMaxResult count_max(const AreaFactory& factory, const PlotSpec& plot, int limit = kDefaultProbeLimit);

struct AreaKindProbe {
    AreaKind kind = AreaKind::kLine;
    int capacity_min = 0;
    std::optional<int> capacity_max;
    std::optional<int> count_max_with_capacity_max;
    std::optional<int> count_max_with_capacity_min;
    double util_rate_capacity_max = 0.0;
    double util_rate_capacity_min = 0.0;
};

// Maximum capacity of one area of kind and how many areas fit at the
// maximum and at the minimum capacity.
AreaKindProbe probe_area_kind(AreaKind kind,
                              const VehicleParameters& params,
                              const PlotSpec& plot,
                              int limit = kDefaultProbeLimit);

}  // namespace depotpack
