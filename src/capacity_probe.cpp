#include "depotpack/capacity_probe.hpp"

#include <stdexcept>
#include <string>

namespace depotpack {

std::unique_ptr<Bin> make_bin(const PlotSpec& plot, bool record_history) {
    if (plot.with_distances) {
        return std::make_unique<BinWithDistances>(plot.a, plot.b, plot.clearance, record_history);
    }
    return std::make_unique<Bin>(plot.a, plot.b, record_history);
}

std::optional<int> capacity_max(const CapacityFactory& factory,
                                int capacity_min,
                                const PlotSpec& plot,
                                int limit) {
    if (capacity_min < 1) {
        throw std::invalid_argument("capacity_max: capacity_min must be >= 1");
    }
    if (limit < capacity_min) {
        throw std::invalid_argument("capacity_max: limit must be >= capacity_min");
    }

    const std::unique_ptr<Bin> bin = make_bin(plot);
    for (int c = capacity_min; c <= limit; ++c) {
        Area candidate = factory(c);
        if (!bin->try_put(candidate)) {
            if (c == capacity_min) {
                return std::nullopt;
            }
            return c - 1;
        }
    }
    throw std::runtime_error("capacity_max: capacity still fits at the limit of " + std::to_string(limit));
}

CountMaxResult count_max(const AreaFactory& factory, const PlotSpec& plot, int limit) {
    if (limit < 1) {
        throw std::invalid_argument("count_max: limit must be >= 1");
    }

    CountMaxResult res;
    res.bin = make_bin(plot);
    res.bin->add_item(factory());
    res.bin->pack();
    while (res.bin->feasible().value_or(false)) {
        if (static_cast<int>(res.bin->items().size()) > limit) {
            throw std::runtime_error("count_max: more than " + std::to_string(limit) + " areas fit");
        }
        res.bin->add_item(factory());
        res.bin->repack();
    }

    const int fitted = static_cast<int>(res.bin->items().size()) - 1;
    if (fitted == 0) {
        return res;
    }
    // Identical areas: dropping any one of them restores the last feasible set.
    res.bin->items().pop_back();
    res.bin->repack();
    if (!res.bin->feasible().value_or(false)) {
        throw InternalError("count_max: repack of " + std::to_string(fitted) + " areas is infeasible");
    }
    res.count = fitted;
    return res;
}

AreaKindProbe probe_area_kind(AreaKind kind, const VehicleParameters& params, const PlotSpec& plot, int limit) {
    AreaKindProbe probe;
    probe.kind = kind;
    probe.capacity_min = area_kind_capacity_min(kind);
    probe.capacity_max = capacity_max([&](int c) { return make_area(kind, c, params); }, probe.capacity_min, plot, limit);

    if (probe.capacity_max) {
        const int cap = *probe.capacity_max;
        CountMaxResult res = count_max([&]() { return make_area(kind, cap, params); }, plot, limit);
        probe.count_max_with_capacity_max = res.count;
        if (res.count) {
            probe.util_rate_capacity_max = res.bin->util_rate();
        }
    }

    CountMaxResult res = count_max([&]() { return make_area(kind, probe.capacity_min, params); }, plot, limit);
    probe.count_max_with_capacity_min = res.count;
    if (res.count) {
        probe.util_rate_capacity_min = res.bin->util_rate();
    }
    return probe;
}

}  // namespace depotpack
