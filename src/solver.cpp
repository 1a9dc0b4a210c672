#include "solver.hpp"

#include <set>
#include <stdexcept>
#include <utility>

#include "board.hpp"
#include "errors.hpp"

std::vector<Instance> instances(const Library &lib, const Region &region) {
    std::vector<Instance> out;
    for (auto id = 0zu; id < region.counts.size(); id++) {
        auto count = region.counts[id];
        if (!count)
            continue;
        auto &p = lib.at(id);
        if (!p.size())
            throw problem_error{ fmt::format("Shape {} has no filled cells", id) };
        for (auto i = 0zu; i < count; i++)
            out.push_back(Instance{ &p, i });
    }
    return out;
}

std::optional<Solution> solve(Strategy st, const Library &lib, const Region &region,
        const SolveOptions &opts) {
    switch (st) {
        case Strategy::SAT:
            return solve_sat(lib, region, opts);
        case Strategy::BACKTRACKING:
            return solve_backtracking(lib, region, opts);
        case Strategy::CROSS_CHECK:
            break;
    }
    auto sat = solve_sat(lib, region, opts);
    auto bt = solve_backtracking(lib, region, opts);
    if (sat.has_value() != bt.has_value())
        throw std::logic_error{ fmt::format(
                "strategies disagree on {}x{}: SAT says {}, backtracking says {}",
                region.width, region.height,
                sat ? "solvable" : "unsolvable", bt ? "solvable" : "unsolvable") };
    if (sat && !verify(*sat, lib, region))
        throw std::logic_error{ "SAT returned an invalid tiling" };
    if (bt && !verify(*bt, lib, region))
        throw std::logic_error{ "backtracking returned an invalid tiling" };
    return sat;
}

bool verify(const Solution &sol, const Library &lib, const Region &region) {
    auto required = instances(lib, region);
    if (sol.steps.size() != required.size())
        return false;
    std::set<std::pair<size_t, size_t>> want, seen;
    for (auto [p, i] : required)
        want.emplace(p->id, i);
    Board board{ region.width, region.height };
    for (auto &st : sol.steps) {
        if (!want.contains({ st.shape_id, st.instance }))
            return false;
        if (!seen.emplace(st.shape_id, st.instance).second)
            return false;
        auto &p = lib.at(st.shape_id);
        if (st.trs_id >= p.orientations.size())
            return false;
        // cells must be the recorded orientation at the recorded offset
        auto &o = p.orientations[st.trs_id];
        if (st.cells.size() != o.cells.size())
            return false;
        for (auto i = 0zu; i < o.cells.size(); i++)
            if (st.cells[i] != coords_t{ o.cells[i].first + st.y, o.cells[i].second + st.x })
                return false;
        if (!board.fits(st.cells))
            return false;
        board.place(st.cells, static_cast<ssize_t>(st.shape_id));
    }
    return true;
}
