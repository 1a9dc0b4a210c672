#include "solver.hpp"

#include <algorithm>
#include <utility>

#include "board.hpp"
#include "errors.hpp"
#include "Piece.inl"

std::optional<Solution> solve_backtracking(const Library &lib, const Region &region,
        const SolveOptions &opts) {
    auto pieces = instances(lib, region);
    // most constrained first: fewest orientations, then largest
    std::ranges::stable_sort(pieces, [](const Instance &l, const Instance &r) {
        if (l.piece->orientations.size() != r.piece->orientations.size())
            return l.piece->orientations.size() < r.piece->orientations.size();
        return l.piece->size() > r.piece->size();
    });

    // [i] => cells still needed by pieces[i..]
    std::vector<size_t> needed(pieces.size() + 1, 0);
    for (auto i = pieces.size(); i-- > 0;)
        needed[i] = needed[i + 1] + pieces[i].piece->size();

    Board board{ region.width, region.height };
    std::vector<Placement> history;
    auto steps = 0ull;
    auto f = [&](auto &&self, size_t depth) -> bool {
        if (depth == pieces.size())
            return true;
        if (board.empty_cells() < needed[depth])
            return false;
        auto *p = pieces[depth].piece;
        auto inst = pieces[depth].instance;
        return p->cover(region.width, region.height,
                [&](const Piece::Orientation &o, size_t trs, coords_t tra) {
            if (!board.fits(o.cells, tra))
                return false;
            if (opts.max_steps && ++steps > opts.max_steps)
                throw search_aborted{ fmt::format("backtracking gave up after {} steps",
                        opts.max_steps) };
            auto [dy, dx] = tra;
            Placement placed{ p->id, inst, trs, dx, dy, {} };
            placed.cells.reserve(o.cells.size());
            for (auto [y, x] : o.cells)
                placed.cells.emplace_back(y + dy, x + dx);
            board.place(placed.cells, static_cast<ssize_t>(depth));
            if (opts.observer)
                opts.observer->placed(placed, depth);
            history.push_back(std::move(placed));
            if (self(self, depth + 1))
                return true;
            board.remove(history.back().cells);
            if (opts.observer)
                opts.observer->retracted(history.back(), depth);
            history.pop_back();
            return false;
        });
    };
    if (!f(f, 0zu))
        return std::nullopt;
    return Solution{ std::move(history) };
}
