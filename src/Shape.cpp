#include "Shape.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <boost/container/flat_set.hpp>

#include "errors.hpp"

Shape Shape::from_rows(const std::vector<std::string> &rows) {
    if (rows.size() != LEN)
        throw parse_error{ fmt::format("expected {} grid rows, got {}", LEN, rows.size()) };
    Shape sh{ 0u };
    for (auto row = 0zu; row < LEN; row++) {
        if (rows[row].size() != LEN)
            throw parse_error{ fmt::format("grid row {} should be {} characters, got '{}'",
                    row + 1, LEN, rows[row]) };
        for (auto col = 0zu; col < LEN; col++)
            if (rows[row][col] == '#')
                sh = sh.set(row, col);
    }
    return sh;
}

Shape Shape::transform(unsigned trs, bool norm) const {
    auto out = Shape{ 0u };
    for (auto [row, col] : *this) {
        if (trs & 1u)
            col = static_cast<int>(LEN) - col - 1;
        if (trs & 2u)
            row = static_cast<int>(LEN) - row - 1;
        if (trs & 4u)
            std::swap(row, col);
        out = out.set(row, col);
    }
    return norm ? out.normalize() : out;
}

std::array<Shape, 8> Shape::transforms(bool norm) const {
    return [&]<size_t... Trs>(std::index_sequence<Trs...>) {
        return std::array<Shape, 8>{ transform(Trs, norm)... };
    }(std::make_index_sequence<8>{});
}

std::vector<Shape> Shape::orientations() const {
    boost::container::flat_set<shape_t> seen;
    for (auto sh : transforms(true))
        seen.insert(sh.value);
    std::vector<Shape> out;
    out.reserve(seen.size());
    for (auto v : seen)
        out.emplace_back(v);
    return out;
}

unsigned Shape::symmetry() const {
    auto base = normalize();
    auto stab = 0u;
    auto all = transforms(true);
    for (auto trs = 0u; trs < all.size(); trs++)
        if (all[trs] == base)
            stab |= 1u << trs;
    return stab;
}

std::vector<coords_t> Shape::cells() const {
    std::vector<coords_t> out;
    out.reserve(size());
    for (auto pos : *this)
        out.push_back(pos);
    return out;
}

std::string Shape::to_string() const {
    std::string txt;
    for (auto row = 0u; row < LEN; row++) {
        for (auto col = 0u; col < LEN; col++)
            txt.push_back(test(row, col) ? '#' : '.');
        txt.push_back('\n');
    }
    return txt;
}

static constexpr std::pair<SymmetryGroup, std::string_view> group_names[]{
    { SymmetryGroup::C1, "C1" }, { SymmetryGroup::C2, "C2" }, { SymmetryGroup::C4, "C4" },
    { SymmetryGroup::D1_X, "D1_X" }, { SymmetryGroup::D1_Y, "D1_Y" },
    { SymmetryGroup::D1_P, "D1_P" }, { SymmetryGroup::D1_S, "D1_S" },
    { SymmetryGroup::D2_XY, "D2_XY" }, { SymmetryGroup::D2_PS, "D2_PS" },
    { SymmetryGroup::D4, "D4" },
};

auto fmt::formatter<SymmetryGroup>::format(SymmetryGroup g, format_context &ctx) const
    -> format_context::iterator {
    auto it = std::ranges::find(group_names, g, &std::pair<SymmetryGroup, std::string_view>::first);
    return formatter<string_view>::format(it == std::end(group_names) ? "unknown" : it->second, ctx);
}

auto fmt::formatter<Shape>::format(Shape sh, format_context &ctx) const
    -> format_context::iterator {
    return formatter<string_view>::format(sh.to_string(), ctx);
}
