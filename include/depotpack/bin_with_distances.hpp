#pragma once

#include <cstddef>
#include <optional>

#include "depotpack/area.hpp"
#include "depotpack/bin.hpp"
#include "depotpack/fixed.hpp"
#include "depotpack/geometry.hpp"

namespace depotpack {

// Clearance zones along the inner bin edges. Items may not overlap them and
// item buffers may not cross the bin boundary.
struct EdgeClearance {
    Fixed left = 8;
    Fixed bottom = 15;
    Fixed right = 8;
    Fixed top = 15;

    Fixed depth(Side side) const;
};

// Bin whose placement search honors item buffers and edge clearance zones.
//
// Candidates are only ever moved right and up from the available origin, so
// left/bottom conflicts are resolved and right/top conflicts only validated.
class BinWithDistances : public Bin {
public:
    BinWithDistances(Fixed a, Fixed b, EdgeClearance clearance = {}, bool record_history = false);

    const EdgeClearance& clearance() const { return clearance_; }
    Rect edge_zone(Side side) const;

    std::optional<size_t> try_put(Area& item) const override;

    // Buffer gaps between all packed pairs and against the bin edges.
    bool distances_valid() const;

    // Pass limit of the left/bottom resolution loop for n packed items.
    static int max_resolution_passes(size_t packed);

protected:
    bool allows_enclosed_item() const override { return true; }
    bool invariants_hold() const override { return valid() && distances_valid(); }

private:
    bool edge_conflict(const Area& item, Side side) const;
    bool left_conflict(const Area& item, const Area& packed) const;
    bool bottom_conflict(const Area& item, const Area& packed) const;
    // Moves item right/up until no left or bottom conflict is left. Returns
    // false once item leaves av.
    bool resolve_left_bottom(Area& item, const Rect& av) const;

    EdgeClearance clearance_;
};

}  // namespace depotpack
