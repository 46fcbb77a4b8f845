#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "depotpack/area.hpp"
#include "depotpack/bin.hpp"
#include "depotpack/errors.hpp"

using depotpack::Area;
using depotpack::Bin;
using depotpack::Fixed;
using depotpack::PackState;
using depotpack::Rect;
using depotpack::SplitPiece;

namespace {

void expect_no_overlap(const std::vector<Area>& packed) {
    for (size_t i = 0; i < packed.size(); ++i) {
        for (size_t j = i + 1; j < packed.size(); ++j) {
            EXPECT_FALSE(depotpack::intersect(packed[i].rect(), packed[j].rect())) << "items " << i << ", " << j;
        }
    }
}

void expect_free_space_sound(const std::vector<Area>& packed, const std::vector<Rect>& availables) {
    for (const auto& av : availables) {
        EXPECT_GT(av.a, Fixed());
        EXPECT_GT(av.b, Fixed());
        for (const auto& p : packed) {
            EXPECT_FALSE(depotpack::intersect(av, p.rect())) << av << " overlaps " << p.rect();
        }
    }
    for (size_t i = 0; i < availables.size(); ++i) {
        for (size_t j = 0; j < availables.size(); ++j) {
            if (i != j) {
                EXPECT_FALSE(depotpack::contains(availables[i], availables[j]))
                    << availables[i] << " encloses " << availables[j];
            }
        }
    }
}

Bin mixed_bin(bool record_history) {
    Bin bin(40, 30, record_history);
    bin.add_item(Area::plain(10, 8));
    bin.add_item(Area::plain(12, 5));
    bin.add_item(Area::stacked(3, 4, 3));
    bin.add_item(Area::plain(20, 6));
    bin.add_item(Area::plain(7, 7, {}, 2));
    bin.add_item(Area::plain(15, 9));
    bin.add_item(Area::stacked(5, 2, 2));
    return bin;
}

}  // namespace

TEST(Bin, SingleItemFillsQuarter) {
    Bin bin(10, 10);
    bin.add_item(Area::plain(5, 5));
    EXPECT_EQ(bin.state(), PackState::kUnpacked);
    EXPECT_FALSE(bin.feasible().has_value());

    bin.pack();
    ASSERT_TRUE(bin.feasible().has_value());
    EXPECT_TRUE(*bin.feasible());
    EXPECT_DOUBLE_EQ(bin.util_rate(), 0.25);
    ASSERT_EQ(bin.packed_count(), 1u);
    EXPECT_EQ(bin.packed_item(0).x(), Fixed());
    EXPECT_EQ(bin.packed_item(0).y(), Fixed());

    ASSERT_EQ(bin.availables().size(), 2u);
    EXPECT_EQ(bin.availables()[0], Rect(10, 5, 0, 5));
    EXPECT_EQ(bin.availables()[1], Rect(5, 10, 5, 0));
}

TEST(Bin, OversizedItemFailsPrecheck) {
    Bin bin(5, 5);
    bin.add_item(Area::plain(6, 1));
    bin.pack();
    EXPECT_EQ(bin.feasible(), false);
    EXPECT_EQ(bin.precheck_passed(), false);
    EXPECT_EQ(bin.packed_count(), 0u);
}

TEST(Bin, PrecheckRejectsTotalAreaWithoutPlacing) {
    Bin bin(10, 10);
    for (int i = 0; i < 5; ++i) {
        bin.add_item(Area::plain(5, 5));
    }
    bin.pack();
    EXPECT_EQ(bin.feasible(), false);
    EXPECT_EQ(bin.precheck_passed(), false);
    EXPECT_EQ(bin.packed_count(), 0u);
}

TEST(Bin, TwoLargeSquaresDoNotFit) {
    Bin bin(10, 10);
    bin.add_item(Area::plain(6, 6));
    bin.add_item(Area::plain(6, 6));
    bin.pack();
    EXPECT_EQ(bin.precheck_passed(), true);
    EXPECT_EQ(bin.feasible(), false);
    EXPECT_EQ(bin.packed_count(), 1u);
}

TEST(Bin, ExactFillIsFeasible) {
    Bin bin(20, 20);
    for (int i = 0; i < 20; ++i) {
        bin.add_item(Area::plain(20, 1));
    }
    bin.pack();
    EXPECT_EQ(bin.feasible(), true);
    EXPECT_TRUE(bin.availables().empty());
    EXPECT_DOUBLE_EQ(bin.util_rate(), 1.0);
    EXPECT_EQ(bin.packed_item(19).y(), Fixed(19));
}

TEST(Bin, TwentyFirstStripBecomesInfeasible) {
    Bin bin(20, 20);
    bin.add_item(Area::plain(20, 1));
    bin.pack();
    int count = 1;
    while (bin.feasible().value_or(false)) {
        bin.add_item(Area::plain(20, 1));
        bin.repack();
        ++count;
    }
    EXPECT_EQ(count, 21);
}

TEST(Bin, PackTwiceIsUsageError) {
    Bin bin(10, 10);
    bin.add_item(Area::plain(5, 5));
    bin.pack();
    EXPECT_THROW(bin.pack(), depotpack::UsageError);

    Bin infeasible(5, 5);
    infeasible.add_item(Area::plain(6, 1));
    infeasible.pack();
    EXPECT_THROW(infeasible.pack(), depotpack::UsageError);
}

TEST(Bin, PackWithoutItemsIsUsageError) {
    Bin bin(10, 10);
    EXPECT_THROW(bin.pack(), depotpack::UsageError);
}

TEST(Bin, RepackMatchesFreshBin) {
    Bin bin = mixed_bin(true);
    bin.pack();
    bin.repack();

    Bin fresh = mixed_bin(true);
    fresh.pack();

    EXPECT_EQ(bin.feasible(), fresh.feasible());
    ASSERT_EQ(bin.packed_count(), fresh.packed_count());
    for (size_t i = 0; i < bin.packed_count(); ++i) {
        EXPECT_EQ(bin.packed_item(i).rect(), fresh.packed_item(i).rect());
    }
    EXPECT_EQ(bin.availables(), fresh.availables());
    EXPECT_EQ(bin.history().size(), fresh.history().size());
}

TEST(Bin, SortsByCategoryThenSize) {
    Bin bin = mixed_bin(false);
    bin.pack();
    const auto& items = bin.items();
    EXPECT_EQ(items[0].conflict_category(), 2);
    for (size_t i = 2; i < items.size(); ++i) {
        EXPECT_FALSE(depotpack::packs_before(items[i], items[i - 1]));
    }
    EXPECT_EQ(items[1].a(), Fixed(20));
}

TEST(Bin, FreeSpaceStaysSoundAfterEveryStep) {
    Bin bin = mixed_bin(true);
    bin.pack();
    ASSERT_EQ(bin.feasible(), true);
    ASSERT_EQ(bin.history().size(), bin.items().size() + 1);
    for (const auto& step : bin.history()) {
        expect_no_overlap(step.packed);
        expect_free_space_sound(step.packed, step.availables);
    }
    EXPECT_TRUE(bin.valid());
    EXPECT_EQ(bin.count_inner(), 5);
    EXPECT_EQ(bin.a_inner(), bin.packed_area());
}

TEST(Bin, CountInnerOnlyCountsPackedItems) {
    Bin bin(10, 10);
    bin.add_item(Area::stacked(6, 3, 2));
    bin.add_item(Area::stacked(6, 3, 2));
    bin.pack();
    EXPECT_EQ(bin.feasible(), false);
    EXPECT_EQ(bin.count_inner(), 2);
    EXPECT_EQ(bin.a_inner(), Fixed(72));
    EXPECT_EQ(bin.packed_area(), Fixed(36));
}

TEST(Bin, RemovingAnItemKeepsFeasibility) {
    for (int n = 1; n <= 12; ++n) {
        Bin bin(30, 20);
        for (int i = 0; i < n; ++i) {
            bin.add_item(Area::stacked(4, 3, 2));
        }
        bin.pack();
        if (!bin.feasible().value_or(false)) {
            break;
        }
        if (n > 1) {
            Bin smaller(30, 20);
            for (int i = 0; i < n - 1; ++i) {
                smaller.add_item(Area::stacked(4, 3, 2));
            }
            smaller.pack();
            EXPECT_EQ(smaller.feasible(), true) << "n=" << n;
        }
    }
}

TEST(Bin, PackedItemOutOfRangeThrows) {
    Bin bin(10, 10);
    bin.add_item(Area::plain(5, 5));
    EXPECT_THROW(bin.packed_item(0), std::out_of_range);
    bin.pack();
    EXPECT_NO_THROW(bin.packed_item(0));
}

TEST(Bin, RejectsNonPositiveSize) {
    EXPECT_THROW(Bin(0, 10), std::invalid_argument);
    EXPECT_THROW(Bin(10, -1), std::invalid_argument);
}

TEST(SplitTable, CornerCodes) {
    const Rect av(10, 10, 0, 0);
    EXPECT_EQ(depotpack::split_code(av, Rect(5, 5, 0, 0)), 0b1111);
    EXPECT_EQ(depotpack::split_code(av, Rect(5, 5, 2, 2)), depotpack::kSplitCodeAvailableEncloses);
    EXPECT_EQ(depotpack::split_code(av, av), depotpack::kSplitCodeItemEncloses);
    EXPECT_EQ(depotpack::split_code(av, Rect(12, 12, -1, -1)), 0b1100);
    EXPECT_EQ(depotpack::split_code(av, Rect(5, 12, 5, 0)), 0b0100);
    EXPECT_EQ(depotpack::split_code(av, Rect(12, 5, -1, 5)), 0b1000);
}

TEST(SplitTable, PiecesAroundItem) {
    const Rect av(10, 10, 0, 0);
    const Rect item(4, 4, 3, 2);
    EXPECT_EQ(depotpack::split_piece(SplitPiece::kBelow, av, item), Rect(10, 2, 0, 0));
    EXPECT_EQ(depotpack::split_piece(SplitPiece::kAbove, av, item), Rect(10, 4, 0, 6));
    EXPECT_EQ(depotpack::split_piece(SplitPiece::kLeft, av, item), Rect(3, 10, 0, 0));
    EXPECT_EQ(depotpack::split_piece(SplitPiece::kRight, av, item), Rect(3, 10, 7, 0));
}

TEST(SplitTable, ItemAtOriginLeavesAboveAndRight) {
    const auto pieces = depotpack::split_available(Rect(10, 10, 0, 0), Rect(5, 5, 0, 0), false);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0], Rect(10, 5, 0, 5));
    EXPECT_EQ(pieces[1], Rect(5, 10, 5, 0));
}

TEST(SplitTable, ItemCrossingBottomLeftCorner) {
    // Item overlaps the lower left part of av and sticks out left and down.
    const auto pieces = depotpack::split_available(Rect(10, 10, 5, 5), Rect(10, 10, 0, 0), false);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0], Rect(10, 5, 5, 10));
    EXPECT_EQ(pieces[1], Rect(5, 10, 10, 5));
}

TEST(SplitTable, ItemCrossingTopRightCorner) {
    const auto pieces = depotpack::split_available(Rect(10, 10, 0, 0), Rect(10, 10, 5, 5), false);
    ASSERT_EQ(pieces.size(), 2u);
    EXPECT_EQ(pieces[0], Rect(10, 5, 0, 0));
    EXPECT_EQ(pieces[1], Rect(5, 10, 0, 0));
}

TEST(SplitTable, ItemCoveringAvailableConsumesIt) {
    EXPECT_TRUE(depotpack::split_available(Rect(4, 4, 1, 1), Rect(10, 10, 0, 0), false).empty());
    EXPECT_TRUE(depotpack::split_available(Rect(4, 4, 1, 1), Rect(4, 4, 1, 1), false).empty());
}

TEST(SplitTable, EnclosedItemNeedsPermission) {
    const Rect av(10, 10, 0, 0);
    const Rect item(4, 4, 3, 2);
    EXPECT_THROW(depotpack::split_available(av, item, false), depotpack::InternalError);
    const auto pieces = depotpack::split_available(av, item, true);
    ASSERT_EQ(pieces.size(), 4u);
    EXPECT_EQ(pieces[0], Rect(10, 2, 0, 0));
    EXPECT_EQ(pieces[1], Rect(10, 4, 0, 6));
    EXPECT_EQ(pieces[2], Rect(3, 10, 0, 0));
    EXPECT_EQ(pieces[3], Rect(3, 10, 7, 0));
}

TEST(SplitTable, DisjointRectanglesAreAnError) {
    EXPECT_THROW(depotpack::split_available(Rect(5, 5, 0, 0), Rect(5, 5, 5, 0), false), depotpack::InternalError);
}

namespace {

SplitPiece piece_of(char c) {
    switch (c) {
        case 'B':
            return SplitPiece::kBelow;
        case 'A':
            return SplitPiece::kAbove;
        case 'L':
            return SplitPiece::kLeft;
        default:
            return SplitPiece::kRight;
    }
}

bool strictly_inside(const Rect& r, Fixed px, Fixed py) {
    return r.x_left() < px && px < r.x_right() && r.y_bottom() < py && py < r.y_top();
}

}  // namespace

TEST(SplitTable, EveryCodeSplitsAsTabled) {
    // Pieces per code, in output order: B below, A above, L left, R right.
    const char* const kExpected[16] = {"BL", "BAL", "BLR", "BALR", "L", "AL", "LR", "ALR",
                                       "B",  "BA",  "BR",  "BAR",  "",  "A", "R",  "AR"};
    const Rect av(10, 10, 0, 0);
    const Fixed half = Fixed::parse("0.5");

    for (int code = 0; code < 16; ++code) {
        const int left = (code & 0b1000) ? -2 : 3;
        const int bottom = (code & 0b0100) ? -2 : 3;
        const int right = (code & 0b0010) ? 7 : 12;
        const int top = (code & 0b0001) ? 7 : 12;
        const Rect item(right - left, top - bottom, left, bottom);
        ASSERT_EQ(depotpack::split_code(av, item), code);

        const bool enclosed = code == depotpack::kSplitCodeAvailableEncloses;
        if (enclosed) {
            EXPECT_THROW(depotpack::split_available(av, item, false), depotpack::InternalError);
        }
        const auto pieces = depotpack::split_available(av, item, enclosed);
        const std::string expected = kExpected[code];
        ASSERT_EQ(pieces.size(), expected.size()) << "code " << code;
        for (size_t k = 0; k < pieces.size(); ++k) {
            EXPECT_EQ(pieces[k], depotpack::split_piece(piece_of(expected[k]), av, item)) << "code " << code;
            EXPECT_GT(pieces[k].a, Fixed()) << "code " << code;
            EXPECT_GT(pieces[k].b, Fixed()) << "code " << code;
            EXPECT_TRUE(depotpack::contains(av, pieces[k])) << "code " << code;
            EXPECT_FALSE(depotpack::intersect(pieces[k], item)) << "code " << code;
        }

        // Every free unit cell of av is covered by some piece.
        for (int i = 0; i < 10; ++i) {
            for (int j = 0; j < 10; ++j) {
                const Fixed px = Fixed(i) + half;
                const Fixed py = Fixed(j) + half;
                if (strictly_inside(item, px, py)) {
                    continue;
                }
                bool covered = false;
                for (const auto& p : pieces) {
                    covered = covered || strictly_inside(p, px, py);
                }
                EXPECT_TRUE(covered) << "code " << code << " cell " << i << "," << j;
            }
        }
    }
}
