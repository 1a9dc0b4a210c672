#include <cstdio>
#include <stdexcept>
#include <string_view>

#include <mimalloc-new-delete.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "config.hpp"
#include "puzzle.hpp"
#include "runner.hpp"
#include "util.hpp"

static std::string_view name(Strategy st) {
    switch (st) {
        case Strategy::SAT: return "SAT";
        case Strategy::BACKTRACKING: return "Backtracking";
        case Strategy::CROSS_CHECK: return "SAT + Backtracking";
    }
    return "unknown";
}

static std::string_view name(Verdict v) {
    switch (v) {
        case Verdict::SOLVED: return "solved";
        case Verdict::UNSOLVABLE: return "no solution";
        case Verdict::UNKNOWN: return "unknown";
        case Verdict::ERROR: return "error";
    }
    return "unknown";
}

int main(int argc, char *argv[]) {
    if (argc != 2) {
        fmt::print(stderr, "usage: {} <input>\n", argv[0]);
        fmt::print(stderr, "set env S to sat|bt|x, V to print every region, "
                "J to the number of threads, N to the backtracking step budget, "
                "T to the SAT timeout in ms\n");
        return 1;
    }

    Config cfg;
    Puzzle pz;
    try {
        cfg = Config::from_env();
        pz = load_puzzle(argv[1]);
    } catch (const std::runtime_error &e) {
        fmt::print(stderr, "{}\n", e.what());
        return 1;
    }

    fmt::print("========== {} ==========\n", name(cfg.strategy));
    fmt::print("Parsed {} shapes\n", pz.shapes.size());
    fmt::print("Parsed {} problem spaces\n", pz.regions.size());
    fmt::print("\nAnalyzing shape symmetries:\n");
    for (auto &p : pz.shapes) {
        fmt::print("  Shape {}: {} cells, {} unique transformations (out of 8 possible), group {}\n",
                p.id, p.size(), p.orientations.size(), p.shape.classify());
        if (cfg.verbose)
            fmt::print("{}", p.shape);
    }

    auto rep = run_batch(pz, cfg);

    for (auto i = 0zu; i < pz.regions.size(); i++) {
        auto &r = pz.regions[i];
        auto &o = rep.outcomes[i];
        if (o.verdict == Verdict::UNKNOWN || o.verdict == Verdict::ERROR)
            fmt::print(stderr, "Warning: problem space {} ({}x{}): {}: {}\n",
                    i + 1, r.width, r.height, name(o.verdict), o.message);
        if (!cfg.verbose)
            continue;
        fmt::print("\n----- Problem Space {} -----\n", i + 1);
        fmt::print("Dimensions: {}x{}\n", r.width, r.height);
        fmt::print("Shape counts: [{}]\n", fmt::join(r.counts, ", "));
        if (o.variables)
            fmt::print("SAT: {} variables, {} clauses\n", display(o.variables), display(o.clauses));
        if (o.placed)
            fmt::print("Backtracking: {} placements tried\n", display(o.placed));
        fmt::print("Result: {} in {}\n", name(o.verdict), display(o.us / 1e6));
        if (o.solution) {
            fmt::print("\nSolution visualization:\n");
            fmt::print("{}", o.solution->render(r.width, r.height));
        }
    }

    fmt::print("\nSummary: {}\n", rep.summary());
    if (rep.unknown || rep.errors)
        fmt::print("{} unknown, {} failed\n", rep.unknown, rep.errors);
    fmt::print("Total time: {}\n", display(rep.us / 1e6));
    if (rep.solved)
        fmt::print("Average per solved problem: {}\n", display(rep.us / 1e6 / rep.solved));
}
