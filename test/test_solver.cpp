#include <gtest/gtest.h>

#include <set>
#include <string>
#include <vector>

#include "errors.hpp"
#include "fixtures.hpp"
#include "solver.hpp"

namespace {

struct Recorder : SearchObserver {
    size_t n_placed{}, n_retracted{};
    size_t variables{}, clauses{};
    std::vector<Placement> first;

    void placed(const Placement &p, size_t) override {
        if (!n_placed++)
            first.push_back(p);
    }
    void retracted(const Placement &, size_t) override { n_retracted++; }
    void encoded(size_t v, size_t c) override { variables = v, clauses = c; }
};

Library single_cell() {
    Library lib;
    lib.push(0, shape("#..", "...", "..."));
    return lib;
}

std::set<coords_t> covered(const Solution &sol) {
    std::set<coords_t> out;
    for (auto &st : sol.steps)
        out.insert(st.cells.begin(), st.cells.end());
    return out;
}

} // namespace

class BothStrategies : public ::testing::TestWithParam<Strategy> { };

TEST_P(BothStrategies, SingleCellsFillBoard) {
    auto lib = single_cell();
    Region r{ 2, 2, { 4 } };
    auto sol = solve(GetParam(), lib, r);
    ASSERT_TRUE(sol);
    EXPECT_EQ(sol->steps.size(), 4u);
    EXPECT_EQ(covered(*sol).size(), 4u);
    EXPECT_TRUE(verify(*sol, lib, r));
}

TEST_P(BothStrategies, TwoPlusesDoNotFit) {
    Library lib;
    lib.push(0, shape(".#.", "###", ".#."));
    lib.push(1, shape("#..", "#..", "###"));
    EXPECT_FALSE(solve(GetParam(), lib, Region{ 3, 3, { 2 } }));
    EXPECT_FALSE(solve(GetParam(), lib, Region{ 3, 3, { 0, 2 } }));
}

TEST_P(BothStrategies, NothingRequired) {
    auto pz = parse_puzzle(EXAMPLE);
    auto sol = solve(GetParam(), pz.shapes, Region{ 5, 5, { 0, 0, 0, 0, 0, 0 } });
    ASSERT_TRUE(sol);
    EXPECT_TRUE(sol->steps.empty());
    sol = solve(GetParam(), pz.shapes, Region{ 5, 5, {} });
    ASSERT_TRUE(sol);
    EXPECT_TRUE(sol->steps.empty());
}

TEST_P(BothStrategies, SquaresOverlapOnThreeByThree) {
    Library lib;
    lib.push(0, shape("##.", "##.", "..."));
    EXPECT_FALSE(solve(GetParam(), lib, Region{ 3, 3, { 2 } }));
    EXPECT_TRUE(solve(GetParam(), lib, Region{ 4, 2, { 2 } }));
}

TEST_P(BothStrategies, PieceLargerThanBoard) {
    Library lib;
    lib.push(0, shape("###", "...", "..."));
    EXPECT_FALSE(solve(GetParam(), lib, Region{ 2, 2, { 1 } }));
}

TEST_P(BothStrategies, SmallExampleRegion) {
    auto pz = parse_puzzle(EXAMPLE);
    auto &r = pz.regions[0];
    auto sol = solve(GetParam(), pz.shapes, r);
    ASSERT_TRUE(sol);
    EXPECT_EQ(sol->steps.size(), 2u);
    EXPECT_TRUE(verify(*sol, pz.shapes, r));
}

TEST_P(BothStrategies, UndefinedShape) {
    auto lib = single_cell();
    EXPECT_THROW((void)solve(GetParam(), lib, Region{ 2, 2, { 1, 1 } }), problem_error);
}

TEST_P(BothStrategies, EmptyShapeRequired) {
    Library lib;
    lib.push(0, Shape{ 0u });
    EXPECT_THROW((void)solve(GetParam(), lib, Region{ 2, 2, { 1 } }), problem_error);
    EXPECT_TRUE(solve(GetParam(), lib, Region{ 2, 2, { 0 } }));
}

INSTANTIATE_TEST_SUITE_P(Solver, BothStrategies,
        ::testing::Values(Strategy::SAT, Strategy::BACKTRACKING, Strategy::CROSS_CHECK));

TEST(Sat, LargeExampleRegion) {
    auto pz = parse_puzzle(EXAMPLE);
    auto &r = pz.regions[1];
    auto sol = solve_sat(pz.shapes, r);
    ASSERT_TRUE(sol);
    EXPECT_EQ(sol->steps.size(), r.pieces());
    EXPECT_TRUE(verify(*sol, pz.shapes, r));
}

TEST(Sat, ThirdExampleRegionUnsolvable) {
    auto pz = parse_puzzle(EXAMPLE);
    EXPECT_FALSE(solve_sat(pz.shapes, pz.regions[2]));
}

TEST(Sat, TimeoutIsUnknown) {
    auto pz = parse_puzzle(EXAMPLE);
    try {
        (void)solve_sat(pz.shapes, pz.regions[2], SolveOptions{ 0, 1 });
        FAIL() << "expected the solver to give up";
    } catch (const search_aborted &e) {
        EXPECT_NE(std::string{ e.what() }.find("gave up"), std::string::npos) << e.what();
    }
}

TEST(Sat, EncodingSize) {
    auto lib = single_cell();
    Recorder rec;
    auto sol = solve_sat(lib, Region{ 2, 2, { 4 } }, SolveOptions{ 0, 0, &rec });
    ASSERT_TRUE(sol);
    // 4 instances x 4 cells; per instance 1 + 6 clauses, per cell 6 clauses
    EXPECT_EQ(rec.variables, 16u);
    EXPECT_EQ(rec.clauses, 52u);
}

TEST(Backtracking, StepBudget) {
    auto lib = single_cell();
    Region r{ 2, 2, { 4 } };
    EXPECT_THROW((void)solve_backtracking(lib, r, SolveOptions{ 1 }), search_aborted);
    EXPECT_TRUE(solve_backtracking(lib, r, SolveOptions{ 100 }));
}

TEST(Backtracking, ObserverBalances) {
    Library lib;
    lib.push(0, shape("#..", "##.", "..."));
    Region r{ 3, 4, { 4 } };
    Recorder rec;
    auto sol = solve_backtracking(lib, r, SolveOptions{ 0, 0, &rec });
    ASSERT_TRUE(sol);
    EXPECT_EQ(rec.n_placed - rec.n_retracted, 4u);
    EXPECT_TRUE(verify(*sol, lib, r));
}

TEST(Backtracking, MostConstrainedFirst) {
    Library lib;
    lib.push(0, shape("##.", "...", "..."));
    lib.push(1, shape(".#.", "###", ".#."));
    Region r{ 4, 3, { 1, 1 } };
    Recorder rec;
    auto sol = solve_backtracking(lib, r, SolveOptions{ 0, 0, &rec });
    ASSERT_TRUE(sol);
    ASSERT_EQ(rec.first.size(), 1u);
    EXPECT_EQ(rec.first.front().shape_id, 1u);
    EXPECT_EQ(sol->steps.front().shape_id, 1u);
}

TEST(CrossCheck, Trominoes) {
    Library lib;
    lib.push(0, shape("#..", "##.", "..."));
    lib.push(1, shape("###", "...", "..."));
    EXPECT_TRUE(solve(Strategy::CROSS_CHECK, lib, Region{ 4, 3, { 4 } }));
    EXPECT_TRUE(solve(Strategy::CROSS_CHECK, lib, Region{ 3, 3, { 0, 3 } }));
    EXPECT_FALSE(solve(Strategy::CROSS_CHECK, lib, Region{ 5, 2, { 0, 3 } }));
    EXPECT_TRUE(solve(Strategy::CROSS_CHECK, lib, Region{ 6, 3, { 2, 4 } }));
}

TEST(Verify, RejectsBadTilings) {
    auto lib = single_cell();
    Region r{ 2, 2, { 2 } };
    Solution ok{ {
        Placement{ 0, 0, 0, 0, 0, { { 0, 0 } } },
        Placement{ 0, 1, 0, 1, 0, { { 0, 1 } } },
    } };
    EXPECT_TRUE(verify(ok, lib, r));

    auto overlap = ok;
    overlap.steps[1].cells = { { 0, 0 } };
    EXPECT_FALSE(verify(overlap, lib, r));

    auto outside = ok;
    outside.steps[1].cells = { { 2, 0 } };
    EXPECT_FALSE(verify(outside, lib, r));

    auto twice = ok;
    twice.steps[1].instance = 0;
    EXPECT_FALSE(verify(twice, lib, r));

    auto shifted = ok;
    shifted.steps[1].x = 0;
    EXPECT_FALSE(verify(shifted, lib, r));

    auto turned = ok;
    turned.steps[1].trs_id = 1;
    EXPECT_FALSE(verify(turned, lib, r));

    Solution short_{ std::vector<Placement>{ ok.steps.front() } };
    EXPECT_FALSE(verify(short_, lib, r));
}
