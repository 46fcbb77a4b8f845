#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

#include "depotpack/area.hpp"
#include "depotpack/errors.hpp"
#include "depotpack/fixed.hpp"
#include "depotpack/geometry.hpp"

namespace depotpack {

enum class PackState {
    kUnpacked = 0,
    kFeasible = 1,
    kInfeasible = 2,
};

// Pieces an available rectangle can be split into around a placed item.
enum class SplitPiece {
    kBelow = 0,  // (av.left, av.bottom) .. (av.right, item.bottom)
    kAbove = 1,  // (av.left, item.top) .. (av.right, av.top)
    kLeft = 2,   // (av.left, av.bottom) .. (item.left, av.top)
    kRight = 3,  // (item.right, av.bottom) .. (av.right, av.top)
};

// 4-bit corner relation of an available rectangle relative to an item:
//   bit 3: av.left >= item.left     bit 2: av.bottom >= item.bottom
//   bit 1: av.right > item.right    bit 0: av.top > item.top
int split_code(const Rect& av, const Rect& item);

// Code 12: the item covers the available rectangle completely.
constexpr int kSplitCodeItemEncloses = 0b1100;
// Code 3: the available rectangle strictly encloses the item on all sides.
constexpr int kSplitCodeAvailableEncloses = 0b0011;

Rect split_piece(SplitPiece piece, const Rect& av, const Rect& item);

// Replaces av (which must intersect item) by the free rectangles left around
// item. kSplitCodeItemEncloses leaves nothing. kSplitCodeAvailableEncloses
// throws InternalError unless allow_enclosed_item is set.
std::vector<Rect> split_available(const Rect& av, const Rect& item, bool allow_enclosed_item);

// Snapshot after one packing step.
struct PackingStep {
    std::vector<Area> packed;
    std::vector<Rect> availables;
};

// Rectangular container packed with a first-fit-decreasing heuristic.
//
// Lifecycle: add items, call pack() once, read feasible()/util_rate()/
// count_inner(). repack() resets all packing state and packs the current
// items again.
class Bin {
public:
    Bin(Fixed a, Fixed b, bool record_history = false);
    virtual ~Bin() = default;

    Bin(const Bin&) = default;
    Bin& operator=(const Bin&) = default;
    Bin(Bin&&) = default;
    Bin& operator=(Bin&&) = default;

    Fixed a() const { return a_; }
    Fixed b() const { return b_; }
    Fixed area() const { return a_ * b_; }
    Rect rect() const { return Rect(a_, b_); }

    // Input items. Sorted in place by pack(); positions are written by it.
    std::vector<Area>& items() { return items_; }
    const std::vector<Area>& items() const { return items_; }
    void add_item(Area item) { items_.push_back(std::move(item)); }

    const std::vector<Rect>& availables() const { return availables_; }

    // Packed items are the first packed_count() items in packing order.
    size_t packed_count() const { return packed_count_; }
    const Area& packed_item(size_t i) const;
    std::vector<Area> packed_items() const;

    PackState state() const { return state_; }
    // Empty until pack() has run.
    std::optional<bool> feasible() const;
    std::optional<bool> precheck_passed() const { return precheck_passed_; }

    // No two packed items intersect.
    bool valid() const;

    // Slot count over packed items.
    int count_inner() const;
    // Area of all items regardless of packing.
    Fixed a_inner() const;
    Fixed packed_area() const;
    // Share of the bin area occupied by packed items.
    double util_rate() const;

    bool record_history() const { return record_history_; }
    const std::vector<PackingStep>& history() const { return history_; }

    void pack();
    void repack();

    // Looks for an available rectangle that can take item and moves item to
    // its placement. Returns the index into availables(), or nothing. The
    // item position may change even when nothing is found.
    virtual std::optional<size_t> try_put(Area& item) const;

protected:
    // Whether an item may end up strictly inside an available rectangle.
    virtual bool allows_enclosed_item() const { return false; }
    // Invariants checked once all items are placed.
    virtual bool invariants_hold() const { return valid(); }

    void precheck();
    bool put(size_t index);
    void update_availables(const Area& item);
    void record_step();

    Fixed a_;
    Fixed b_;
    std::vector<Area> items_;
    std::vector<Rect> availables_;
    size_t packed_count_ = 0;
    bool record_history_ = false;
    std::vector<PackingStep> history_;
    PackState state_ = PackState::kUnpacked;
    std::optional<bool> precheck_passed_;
};

// Sort order used by pack(): descending by (conflict_category, a, b).
bool packs_before(const Area& lhs, const Area& rhs);

}  // namespace depotpack
