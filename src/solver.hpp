#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "Piece.hpp"
#include "puzzle.hpp"

// hooks into a running solve; every hook defaults to a no-op
class SearchObserver {
public:
    virtual ~SearchObserver() { }

    // backtracking committed a placement; depth counts from 0
    virtual void placed(const Placement &p, size_t depth) { }
    // backtracking undid a placement
    virtual void retracted(const Placement &p, size_t depth) { }
    // SAT formula is complete and about to be solved
    virtual void encoded(size_t variables, size_t clauses) { }
};

struct SolveOptions {
    uint64_t max_steps{}; // backtracking placements tried, 0 = unlimited
    unsigned timeout_ms{}; // SAT, 0 = none
    SearchObserver *observer{};
};

// one entry per required instance, in shape id then instance order
struct Instance {
    const Piece *piece;
    size_t instance;
};

// throws problem_error if the region asks for an undefined or empty shape
std::vector<Instance> instances(const Library &lib, const Region &region);

// std::nullopt means no tiling exists
// throws problem_error on a malformed region, search_aborted if the solver gave up
std::optional<Solution> solve_sat(const Library &lib, const Region &region,
        const SolveOptions &opts = {});
std::optional<Solution> solve_backtracking(const Library &lib, const Region &region,
        const SolveOptions &opts = {});

enum class Strategy {
    SAT,
    BACKTRACKING,
    CROSS_CHECK, // both, std::logic_error if they disagree on solvability
};

std::optional<Solution> solve(Strategy st, const Library &lib, const Region &region,
        const SolveOptions &opts = {});

// in bounds, pairwise disjoint, every instance placed exactly once,
// and every placement consistent with its orientation and offset
[[nodiscard]] bool verify(const Solution &sol, const Library &lib, const Region &region);
