#include "depotpack/bin_with_distances.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace depotpack {

Fixed EdgeClearance::depth(Side side) const {
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

BinWithDistances::BinWithDistances(Fixed a, Fixed b, EdgeClearance clearance, bool record_history)
    : Bin(a, b, record_history), clearance_(clearance) {
    for (const Side s : kAllSides) {
        if (clearance_.depth(s) < Fixed()) {
            throw std::invalid_argument("BinWithDistances: edge clearance must be >= 0");
        }
    }
    if (clearance_.left > a_ || clearance_.right > a_ || clearance_.bottom > b_ || clearance_.top > b_) {
        throw std::invalid_argument("BinWithDistances: edge clearance exceeds bin size");
    }
}

Rect BinWithDistances::edge_zone(Side side) const {
    switch (side) {
        case Side::kLeft:
            return Rect(clearance_.left, b_, Fixed(), Fixed());
        case Side::kBottom:
            return Rect(a_, clearance_.bottom, Fixed(), Fixed());
        case Side::kRight:
            return Rect(clearance_.right, b_, a_ - clearance_.right, Fixed());
        case Side::kTop:
            return Rect(a_, clearance_.top, Fixed(), b_ - clearance_.top);
    }
    throw std::invalid_argument("BinWithDistances::edge_zone: invalid side");
}

int BinWithDistances::max_resolution_passes(size_t packed) {
    return std::max(50, 2 * static_cast<int>(packed) + 2);
}

bool BinWithDistances::edge_conflict(const Area& item, Side side) const {
    const Rect buf = item.buffer_rect(side);
    bool crosses = false;
    switch (side) {
        case Side::kLeft:
            crosses = buf.x_left() < Fixed();
            break;
        case Side::kBottom:
            crosses = buf.y_bottom() < Fixed();
            break;
        case Side::kRight:
            crosses = buf.x_right() > a_;
            break;
        case Side::kTop:
            crosses = buf.y_top() > b_;
            break;
    }
    return crosses || intersect(item.rect(), edge_zone(side));
}

bool BinWithDistances::left_conflict(const Area& item, const Area& packed) const {
    return intersect(item.buffer_rect(Side::kLeft), packed.rect()) ||
           intersect(item.rect(), packed.buffer_rect(Side::kRight));
}

bool BinWithDistances::bottom_conflict(const Area& item, const Area& packed) const {
    return intersect(item.buffer_rect(Side::kBottom), packed.rect()) ||
           intersect(item.rect(), packed.buffer_rect(Side::kTop));
}

bool BinWithDistances::resolve_left_bottom(Area& item, const Rect& av) const {
    const int max_passes = max_resolution_passes(packed_count_);
    for (int pass = 0;; ++pass) {
        if (pass >= max_passes) {
            throw InternalError("BinWithDistances::try_put: buffer resolution did not converge after " +
                                std::to_string(max_passes) + " passes");
        }
        bool moved = false;

        for (size_t i = 0; i < packed_count_; ++i) {
            const Area& p = items_[i];
            if (left_conflict(item, p)) {
                const Fixed old_x = item.x();
                item.set_x(p.rect().x_right() + std::max(item.buffer_depth(Side::kLeft), p.buffer_depth(Side::kRight)));
                if (item.x() < old_x) {
                    throw InternalError("BinWithDistances::try_put: item moved left during resolution");
                }
                moved = moved || item.x() != old_x;
            }
        }
        if (!contains(av, item.rect())) {
            return false;
        }

        for (size_t i = 0; i < packed_count_; ++i) {
            const Area& p = items_[i];
            if (bottom_conflict(item, p)) {
                const Fixed old_y = item.y();
                item.set_y(p.rect().y_top() + std::max(item.buffer_depth(Side::kBottom), p.buffer_depth(Side::kTop)));
                if (item.y() < old_y) {
                    throw InternalError("BinWithDistances::try_put: item moved down during resolution");
                }
                moved = moved || item.y() != old_y;
            }
        }
        if (!contains(av, item.rect())) {
            return false;
        }

        if (!moved) {
            return true;
        }
    }
}

std::optional<size_t> BinWithDistances::try_put(Area& item) const {
    for (size_t k = 0; k < availables_.size(); ++k) {
        const Rect& av = availables_[k];
        if (!fits_into(item.rect(), av)) {
            continue;
        }
        item.set_position(av.x, av.y);

        if (edge_conflict(item, Side::kLeft)) {
            const Fixed old_x = item.x();
            item.set_x(std::max(item.buffer_depth(Side::kLeft), clearance_.left));
            if (!(old_x < item.x())) {
                throw InternalError("BinWithDistances::try_put: left edge shift did not move the item right");
            }
            if (!contains(av, item.rect())) {
                continue;
            }
        }

        if (edge_conflict(item, Side::kBottom)) {
            const Fixed old_y = item.y();
            item.set_y(std::max(item.buffer_depth(Side::kBottom), clearance_.bottom));
            if (!(old_y <= item.y())) {
                throw InternalError("BinWithDistances::try_put: bottom edge shift moved the item down");
            }
            if (!contains(av, item.rect())) {
                continue;
            }
        }

        if (!resolve_left_bottom(item, av)) {
            continue;
        }

        const Rect ir = item.rect();
        bool ok = true;
        for (size_t i = 0; i < packed_count_ && ok; ++i) {
            ok = !intersect(ir, items_[i].rect());
        }
        if (!ok || edge_conflict(item, Side::kRight)) {
            continue;
        }
        // A right or top conflict with item i is a left or bottom conflict
        // with the roles swapped.
        for (size_t i = 0; i < packed_count_ && ok; ++i) {
            ok = !left_conflict(items_[i], item);
        }
        if (!ok || edge_conflict(item, Side::kTop)) {
            continue;
        }
        for (size_t i = 0; i < packed_count_ && ok; ++i) {
            ok = !bottom_conflict(items_[i], item);
        }
        if (!ok) {
            continue;
        }
        return k;
    }
    return std::nullopt;
}

bool BinWithDistances::distances_valid() const {
    for (size_t i = 0; i < packed_count_; ++i) {
        const Area& item = items_[i];
        for (const Side s : kAllSides) {
            if (edge_conflict(item, s)) {
                return false;
            }
        }
        for (size_t j = 0; j < packed_count_; ++j) {
            if (i == j) {
                continue;
            }
            if (left_conflict(item, items_[j]) || bottom_conflict(item, items_[j])) {
                return false;
            }
        }
    }
    return true;
}

}  // namespace depotpack
