#include "Piece.inl"

#include <algorithm>
#include <utility>

#include "errors.hpp"

Piece::Piece(size_t i, Shape s) : id{ i }, shape{ s } {
    for (auto sh : shape.orientations())
        orientations.push_back(Orientation{ sh.cells(), sh.height(), sh.width() });
}

std::vector<Placement> Piece::placements(size_t instance, size_t width, size_t height) const {
    std::vector<Placement> out;
    cover(width, height, [&](const Orientation &o, size_t trs, coords_t tra) {
        auto [dy, dx] = tra;
        Placement p{ id, instance, trs, dx, dy, {} };
        p.cells.reserve(o.cells.size());
        for (auto [y, x] : o.cells)
            p.cells.emplace_back(y + dy, x + dx);
        out.push_back(std::move(p));
        return false;
    });
    return out;
}

void Library::push(size_t id, Shape sh) {
    if (find(id))
        throw parse_error{ fmt::format("shape {} defined twice", id) };
    lib.emplace_back(id, sh);
}

const Piece *Library::find(size_t id) const {
    auto it = std::ranges::find(lib, id, &Piece::id);
    if (it == lib.end())
        return nullptr;
    return &*it;
}

const Piece &Library::at(size_t id) const {
    if (auto p = find(id))
        return *p;
    throw problem_error{ fmt::format("Shape {} not found", id) };
}

Solution::Solution(std::vector<Placement> st) : steps{ std::move(st) } { }

std::vector<std::vector<ssize_t>> Solution::map(size_t width, size_t height) const {
    std::vector<std::vector<ssize_t>> m(height, std::vector<ssize_t>(width, -1));
    for (auto i = 0zu; i < steps.size(); i++)
        for (auto [y, x] : steps[i].cells)
            m[y][x] = static_cast<ssize_t>(i);
    return m;
}

static char symbol(size_t id) {
    if (id < 10)
        return static_cast<char>('0' + id);
    if (id < 36)
        return static_cast<char>('A' + id - 10);
    return '?';
}

std::string Solution::render(size_t width, size_t height) const {
    std::string txt;
    txt.reserve((width + 1) * height);
    for (auto &row : map(width, height)) {
        for (auto v : row)
            txt.push_back(v < 0 ? '.' : symbol(steps[v].shape_id));
        txt.push_back('\n');
    }
    return txt;
}
