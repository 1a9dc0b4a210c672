#include <gtest/gtest.h>

#include <set>
#include <utility>
#include <vector>

#include "Piece.hpp"
#include "errors.hpp"
#include "fixtures.hpp"

TEST(Piece, SingleCellCoversEveryCell) {
    Piece p{ 0, shape("#..", "...", "...") };
    auto pl = p.placements(3, 2, 2);
    ASSERT_EQ(pl.size(), 4u);
    std::set<coords_t> seen;
    for (auto &x : pl) {
        EXPECT_EQ(x.shape_id, 0u);
        EXPECT_EQ(x.instance, 3u);
        ASSERT_EQ(x.cells.size(), 1u);
        seen.insert(x.cells.front());
    }
    EXPECT_EQ(seen.size(), 4u);
}

TEST(Piece, DominoOnThreeByTwo) {
    Piece p{ 1, shape("##.", "...", "...") };
    ASSERT_EQ(p.orientations.size(), 2u);
    // 2x2 horizontal offsets plus 3x1 vertical ones
    EXPECT_EQ(p.placements(0, 3, 2).size(), 7u);
}

TEST(Piece, TooLargeForBoard) {
    Piece p{ 2, shape("###", "###", "###") };
    EXPECT_TRUE(p.placements(0, 2, 2).empty());
    EXPECT_TRUE(p.placements(0, 9, 2).empty());
    EXPECT_EQ(p.placements(0, 3, 3).size(), 1u);
}

TEST(Piece, PlacementsStayInsideBoard) {
    std::vector<Shape> shapes{
        shape("###", "##.", "##."),
        shape("#..", "#..", "###"),
        shape(".#.", "###", ".#."),
        shape("##.", ".##", "..."),
        shape("#..", "...", "#.#"),
    };
    for (auto &sh : shapes) {
        Piece p{ 0, sh };
        std::vector<std::pair<size_t, size_t>> boards{ { 1, 1 }, { 3, 3 }, { 4, 7 }, { 12, 5 } };
        for (auto [w, h] : boards) {
            auto pl = p.placements(0, w, h);
            EXPECT_LE(pl.size(), p.orientations.size() * w * h);
            std::set<std::vector<coords_t>> distinct;
            for (auto &x : pl) {
                ASSERT_EQ(x.cells.size(), sh.size());
                for (auto [y, xx] : x.cells) {
                    EXPECT_GE(y, 0);
                    EXPECT_GE(xx, 0);
                    EXPECT_LT(static_cast<size_t>(y), h);
                    EXPECT_LT(static_cast<size_t>(xx), w);
                }
                distinct.insert(x.cells);
            }
            EXPECT_EQ(distinct.size(), pl.size());
        }
    }
}

TEST(Piece, PlacementMatchesOffset) {
    Piece p{ 0, shape(".#.", "###", ".#.") };
    auto pl = p.placements(0, 4, 3);
    ASSERT_EQ(pl.size(), 2u);
    EXPECT_EQ(pl[1].x, 1);
    EXPECT_EQ(pl[1].y, 0);
    EXPECT_EQ(pl[1].cells, (std::vector<coords_t>{ { 0, 2 }, { 1, 1 }, { 1, 2 }, { 1, 3 }, { 2, 2 } }));
}

TEST(Library, LookupAndDuplicates) {
    Library lib;
    lib.push(0, shape("#..", "...", "..."));
    lib.push(3, shape("##.", "...", "..."));
    EXPECT_EQ(lib.size(), 2u);
    EXPECT_EQ(lib.at(3).size(), 2u);
    EXPECT_EQ(lib.find(1), nullptr);
    EXPECT_THROW((void)lib.at(1), problem_error);
    EXPECT_THROW(lib.push(3, shape("###", "...", "...")), parse_error);
}

TEST(Solution, RenderAndMap) {
    Solution sol{ {
        Placement{ 0, 0, 0, 0, 0, { { 0, 0 }, { 0, 1 } } },
        Placement{ 11, 0, 0, 1, 1, { { 1, 1 } } },
    } };
    EXPECT_EQ(sol.render(2, 2), "00\n.B\n");
    auto m = sol.map(2, 2);
    EXPECT_EQ(m[0][1], 0);
    EXPECT_EQ(m[1][0], -1);
    EXPECT_EQ(m[1][1], 1);
}
