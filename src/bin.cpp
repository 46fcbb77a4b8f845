#include "depotpack/bin.hpp"

#include <algorithm>
#include <array>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>

namespace depotpack {
namespace {

struct SplitCase {
    bool reachable = true;
    int n = 0;
    std::array<SplitPiece, 4> pieces{};
};

constexpr SplitPiece kB = SplitPiece::kBelow;
constexpr SplitPiece kA = SplitPiece::kAbove;
constexpr SplitPiece kL = SplitPiece::kLeft;
constexpr SplitPiece kR = SplitPiece::kRight;

// Indexed by split_code(). Piece order is significant: new availables are
// appended in this order before the stable (b, a) sort.
constexpr std::array<SplitCase, 16> kSplitTable{{
    /* 0b0000 */ {true, 2, {kB, kL}},
    /* 0b0001 */ {true, 3, {kB, kA, kL}},
    /* 0b0010 */ {true, 3, {kB, kL, kR}},
    /* 0b0011 */ {false, 4, {kB, kA, kL, kR}},  // item strictly inside av
    /* 0b0100 */ {true, 1, {kL}},
    /* 0b0101 */ {true, 2, {kA, kL}},
    /* 0b0110 */ {true, 2, {kL, kR}},
    /* 0b0111 */ {true, 3, {kA, kL, kR}},
    /* 0b1000 */ {true, 1, {kB}},
    /* 0b1001 */ {true, 2, {kB, kA}},
    /* 0b1010 */ {true, 2, {kB, kR}},
    /* 0b1011 */ {true, 3, {kB, kA, kR}},
    /* 0b1100 */ {true, 0, {}},  // item covers av
    /* 0b1101 */ {true, 1, {kA}},
    /* 0b1110 */ {true, 1, {kR}},
    /* 0b1111 */ {true, 2, {kA, kR}},
}};

std::string describe(const Rect& av, const Rect& item) {
    std::ostringstream oss;
    oss << "av {" << av << "}, item {" << item << "}";
    return oss.str();
}

}  // namespace

int split_code(const Rect& av, const Rect& item) {
    const bool bx_bl = av.x_left() >= item.x_left();
    const bool by_bl = av.y_bottom() >= item.y_bottom();
    const bool bx_tr = av.x_right() > item.x_right();
    const bool by_tr = av.y_top() > item.y_top();
    return (bx_bl ? 8 : 0) | (by_bl ? 4 : 0) | (bx_tr ? 2 : 0) | (by_tr ? 1 : 0);
}

Rect split_piece(SplitPiece piece, const Rect& av, const Rect& item) {
    switch (piece) {
        case SplitPiece::kBelow:
            return Rect(av.x_right() - av.x_left(), item.y_bottom() - av.y_bottom(), av.x_left(), av.y_bottom());
        case SplitPiece::kAbove:
            return Rect(av.x_right() - av.x_left(), av.y_top() - item.y_top(), av.x_left(), item.y_top());
        case SplitPiece::kLeft:
            return Rect(item.x_left() - av.x_left(), av.y_top() - av.y_bottom(), av.x_left(), av.y_bottom());
        case SplitPiece::kRight:
            return Rect(av.x_right() - item.x_right(), av.y_top() - av.y_bottom(), item.x_right(), av.y_bottom());
    }
    throw std::invalid_argument("split_piece: invalid piece");
}

std::vector<Rect> split_available(const Rect& av, const Rect& item, bool allow_enclosed_item) {
    const int code = split_code(av, item);
    const SplitCase& sc = kSplitTable[static_cast<size_t>(code)];
    if (!intersect(av, item)) {
        throw InternalError("split_available: rectangles do not intersect: " + describe(av, item));
    }
    if (!sc.reachable && !allow_enclosed_item) {
        throw InternalError("split_available: available rectangle encloses item: " + describe(av, item));
    }

    std::vector<Rect> out;
    out.reserve(static_cast<size_t>(sc.n));
    for (int i = 0; i < sc.n; ++i) {
        out.push_back(split_piece(sc.pieces[static_cast<size_t>(i)], av, item));
    }
    return out;
}

bool packs_before(const Area& lhs, const Area& rhs) {
    if (lhs.conflict_category() != rhs.conflict_category()) {
        return lhs.conflict_category() > rhs.conflict_category();
    }
    if (lhs.a() != rhs.a()) {
        return lhs.a() > rhs.a();
    }
    return lhs.b() > rhs.b();
}

Bin::Bin(Fixed a, Fixed b, bool record_history)
    : a_(a), b_(b), items_(), availables_(), record_history_(record_history), history_() {
    if (!(a_ > Fixed()) || !(b_ > Fixed())) {
        throw std::invalid_argument("Bin: a and b must be > 0");
    }
    availables_.push_back(Rect(a_, b_));
}

const Area& Bin::packed_item(size_t i) const {
    if (i >= packed_count_) {
        throw std::out_of_range("Bin::packed_item: index out of range");
    }
    return items_[i];
}

std::vector<Area> Bin::packed_items() const {
    return std::vector<Area>(items_.begin(), items_.begin() + static_cast<std::ptrdiff_t>(packed_count_));
}

std::optional<bool> Bin::feasible() const {
    switch (state_) {
        case PackState::kUnpacked:
            return std::nullopt;
        case PackState::kFeasible:
            return true;
        case PackState::kInfeasible:
            return false;
    }
    return std::nullopt;
}

bool Bin::valid() const {
    for (size_t i = 0; i < packed_count_; ++i) {
        const Rect ri = items_[i].rect();
        for (size_t j = i + 1; j < packed_count_; ++j) {
            if (intersect(ri, items_[j].rect())) {
                return false;
            }
        }
    }
    return true;
}

int Bin::count_inner() const {
    int total = 0;
    for (size_t i = 0; i < packed_count_; ++i) {
        total += items_[i].count_inner();
    }
    return total;
}

Fixed Bin::a_inner() const {
    Fixed total;
    for (const auto& item : items_) {
        total += item.area();
    }
    return total;
}

Fixed Bin::packed_area() const {
    Fixed total;
    for (size_t i = 0; i < packed_count_; ++i) {
        total += items_[i].area();
    }
    return total;
}

double Bin::util_rate() const {
    return ratio(packed_area(), area());
}

void Bin::precheck() {
    for (const auto& item : items_) {
        if (item.a() > a_ || item.b() > b_) {
            precheck_passed_ = false;
            return;
        }
    }
    if (a_inner() > area()) {
        precheck_passed_ = false;
        return;
    }
    precheck_passed_ = true;
}

void Bin::pack() {
    if (state_ != PackState::kUnpacked || packed_count_ != 0) {
        throw UsageError("Bin::pack: already packed, call repack() to pack again");
    }
    if (items_.empty()) {
        throw UsageError("Bin::pack: item list is empty");
    }

    precheck();
    if (!*precheck_passed_) {
        state_ = PackState::kInfeasible;
        return;
    }

    std::stable_sort(items_.begin(), items_.end(), packs_before);
    record_step();

    for (size_t i = 0; i < items_.size(); ++i) {
        if (!put(i)) {
            state_ = PackState::kInfeasible;
            return;
        }
        record_step();
    }

    if (!invariants_hold()) {
        throw InternalError("Bin::pack: packed items violate placement invariants");
    }
    state_ = PackState::kFeasible;
}

void Bin::repack() {
    availables_.clear();
    availables_.push_back(Rect(a_, b_));
    packed_count_ = 0;
    history_.clear();
    state_ = PackState::kUnpacked;
    precheck_passed_.reset();

    pack();
}

std::optional<size_t> Bin::try_put(Area& item) const {
    for (size_t k = 0; k < availables_.size(); ++k) {
        const Rect& av = availables_[k];
        if (fits_into(item.rect(), av)) {
            item.set_position(av.x, av.y);
            return k;
        }
    }
    return std::nullopt;
}

bool Bin::put(size_t index) {
    if (index != packed_count_) {
        throw InternalError("Bin::put: items must be placed in order");
    }
    Area& item = items_[index];
    if (!try_put(item)) {
        return false;
    }
    ++packed_count_;
    update_availables(item);
    return true;
}

void Bin::update_availables(const Area& item) {
    const Rect ir = item.rect();

    // Split every available rectangle the item overlaps.
    std::vector<Rect> next;
    std::vector<Rect> created;
    next.reserve(availables_.size() + 4);
    for (const Rect& av : availables_) {
        if (intersect(av, ir)) {
            auto pieces = split_available(av, ir, allows_enclosed_item());
            created.insert(created.end(), pieces.begin(), pieces.end());
        } else {
            next.push_back(av);
        }
    }
    next.insert(next.end(), created.begin(), created.end());

    // Drop rectangles enclosed by another one. Visiting pairs by descending
    // area means only the smaller one of a pair can be enclosed.
    std::vector<size_t> pool(next.size());
    std::iota(pool.begin(), pool.end(), size_t{0});
    std::stable_sort(pool.begin(), pool.end(), [&](size_t l, size_t r) {
        return next[l].area() > next[r].area();
    });
    std::vector<bool> removed(next.size(), false);
    for (size_t i = 0; i < pool.size(); ++i) {
        for (size_t j = i + 1; j < pool.size(); ++j) {
            if (contains(next[pool[i]], next[pool[j]])) {
                removed[pool[j]] = true;
            }
        }
    }

    availables_.clear();
    for (size_t k = 0; k < next.size(); ++k) {
        if (!removed[k]) {
            availables_.push_back(next[k]);
        }
    }

    for (const Rect& av : availables_) {
        if (!(av.a > Fixed()) || !(av.b > Fixed())) {
            throw InternalError("Bin::update_availables: degenerate available rectangle: " + describe(av, ir));
        }
        for (size_t i = 0; i < packed_count_; ++i) {
            if (intersect(av, items_[i].rect())) {
                throw InternalError("Bin::update_availables: available overlaps packed item: " +
                                    describe(av, items_[i].rect()));
            }
        }
    }

    std::stable_sort(availables_.begin(), availables_.end(), [](const Rect& l, const Rect& r) {
        if (l.b != r.b) {
            return l.b < r.b;
        }
        return l.a < r.a;
    });
}

void Bin::record_step() {
    if (!record_history_) {
        return;
    }
    history_.push_back(PackingStep{packed_items(), availables_});
}

}  // namespace depotpack
