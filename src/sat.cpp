#include "solver.hpp"

#include <iterator>
#include <utility>

#include <z3++.h>

#include "errors.hpp"

std::optional<Solution> solve_sat(const Library &lib, const Region &region,
        const SolveOptions &opts) {
    // one variable per placement; each instance owns the range [first, second)
    std::vector<Placement> all;
    std::vector<std::pair<size_t, size_t>> owned;
    for (auto [p, inst] : instances(lib, region)) {
        auto pl = p->placements(inst, region.width, region.height);
        if (pl.empty())
            return std::nullopt; // this instance fits nowhere
        owned.emplace_back(all.size(), all.size() + pl.size());
        all.insert(all.end(), std::make_move_iterator(pl.begin()), std::make_move_iterator(pl.end()));
    }

    z3::context ctx;
    // pure CNF, so the propositional core rather than the SMT one
    z3::solver s = z3::tactic(ctx, "sat").mk_solver();
    if (opts.timeout_ms)
        s.set("timeout", opts.timeout_ms);

    std::vector<z3::expr> vars;
    vars.reserve(all.size());
    for (auto i = 0zu; i < all.size(); i++)
        vars.push_back(ctx.bool_const(fmt::format("p{}", i).c_str()));

    auto clauses = 0zu;
    auto at_most_one = [&](const std::vector<size_t> &ids) {
        for (auto i = 0zu; i < ids.size(); i++)
            for (auto j = i + 1; j < ids.size(); j++)
                s.add(!vars[ids[i]] || !vars[ids[j]]), clauses++;
    };

    // exactly one placement per instance
    for (auto [first, last] : owned) {
        z3::expr_vector any{ ctx };
        std::vector<size_t> ids;
        for (auto i = first; i < last; i++)
            any.push_back(vars[i]), ids.push_back(i);
        s.add(z3::mk_or(any)), clauses++;
        at_most_one(ids);
    }

    // at most one placement per board cell
    std::vector<std::vector<size_t>> by_cell(region.area());
    for (auto i = 0zu; i < all.size(); i++)
        for (auto [y, x] : all[i].cells)
            by_cell[y * region.width + x].push_back(i);
    for (auto &ids : by_cell)
        at_most_one(ids);

    if (opts.observer)
        opts.observer->encoded(all.size(), clauses);

    switch (s.check()) {
        case z3::unsat:
            return std::nullopt;
        case z3::unknown:
            throw search_aborted{ fmt::format("SAT solver gave up: {}", s.reason_unknown()) };
        case z3::sat:
            break;
    }

    auto model = s.get_model();
    std::vector<Placement> chosen;
    for (auto i = 0zu; i < all.size(); i++)
        if (model.eval(vars[i], true).is_true())
            chosen.push_back(std::move(all[i]));
    return Solution{ std::move(chosen) };
}
