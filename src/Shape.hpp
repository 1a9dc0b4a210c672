#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/integer.hpp>
#include <fmt/format.h>

using coords_t = std::pair<int, int>; // Y, X

// bit i is set iff transform i (in Shape::transforms order) maps the shape onto itself
enum class SymmetryGroup : uint16_t {
  C1    = 0b00000001u,
  C2    = 0b00001001u,
  C4    = 0b01101001u,
  D1_X  = 0b00000011u,
  D1_Y  = 0b00000101u,
  D1_P  = 0b00010001u,
  D1_S  = 0b10000001u,
  D2_XY = 0b00001111u,
  D2_PS = 0b10011001u,
  D4    = 0b11111111u,
};

// number of distinct orientations of a shape with this stabilizer
constexpr inline size_t order(SymmetryGroup v) {
    auto s = static_cast<std::underlying_type<SymmetryGroup>::type>(v);
    return 8 / std::popcount(s);
}

class Shape {
public:
    static constexpr size_t LEN = 3;

    // [LSB] [1] [2]
    // [3] ...
    // [6] ...    [MSB]
    using shape_t = boost::uint_t<LEN * LEN>::least;

private:
    static constexpr shape_t FULL = static_cast<shape_t>((1u << (LEN * LEN)) - 1u);
    static constexpr shape_t FIRST_ROW = static_cast<shape_t>((1u << LEN) - 1u);
    static constexpr shape_t FIRST_COL = [] {
        shape_t total{};
        shape_t mask{ 1 };
        for (auto i = 0zu; i < LEN; i++)
            total |= mask, mask <<= LEN;
        return total;
    }();

    shape_t value;

public:
    explicit constexpr Shape(shape_t v)
        : value{ static_cast<shape_t>(v & FULL) } { }

    // LEN rows of LEN characters, '#' is filled, anything else is background
    static Shape from_rows(const std::vector<std::string> &rows);

    constexpr explicit operator bool() const { return value; }
    [[nodiscard]] constexpr bool operator==(const Shape &other) const = default;

    [[nodiscard]] constexpr size_t size() const {
        return std::popcount(static_cast<unsigned>(value));
    }

    [[nodiscard]] constexpr bool test(size_t row, size_t col) const {
        return (value >> (row * LEN + col)) & 1u;
    }

    [[nodiscard]] constexpr Shape set(size_t row, size_t col) const {
        return Shape{ static_cast<shape_t>(value | 1u << (row * LEN + col)) };
    }

    [[nodiscard]] constexpr Shape normalize() const {
        if (!value)
            return Shape{ value };
        auto v = value;
        while (!(v & FIRST_ROW))
            v >>= LEN;
        while (!(v & FIRST_COL))
            v >>= 1u;
        return Shape{ v };
    }

    // excluding top margin
    [[nodiscard]] constexpr size_t height() const {
        auto h = 0zu;
        auto v = normalize().value;
        for (auto row = 1zu; v; row++, v >>= LEN)
            if (v & FIRST_ROW)
                h = row;
        return h;
    }

    // excluding left margin
    [[nodiscard]] constexpr size_t width() const {
        auto w = 0zu;
        auto v = normalize().value;
        for (auto row = 0zu; row < LEN; row++, v >>= LEN)
            for (auto col = 0zu; col < LEN; col++)
                if (v >> col & 1u)
                    w = std::max(w, col + 1);
        return w;
    }

    // trs is a bit set applied in this order:
    //   1 mirrors columns, 2 mirrors rows, 4 swaps rows with columns
    // so 0 is identity, 3 is rot180, 5 and 6 are the quarter turns,
    // 4 and 7 mirror along the diagonals
    [[nodiscard]] Shape transform(unsigned trs, bool norm) const;

    [[nodiscard]] std::array<Shape, 8> transforms(bool norm) const;

    // distinct normalized transforms, ascending by value
    [[nodiscard]] std::vector<Shape> orientations() const;

    // bit trs set iff transform(trs) maps the shape onto itself
    [[nodiscard]] unsigned symmetry() const;

    [[nodiscard]] SymmetryGroup classify() const {
        return static_cast<SymmetryGroup>(symmetry());
    }

    // filled cells, row-major
    [[nodiscard]] std::vector<coords_t> cells() const;

    [[nodiscard]] std::string to_string() const;

    struct bits_proxy {
        shape_t v;
        bool operator==(const bits_proxy &other) const = default;
        constexpr coords_t operator*() const {
            auto id = std::countr_zero(static_cast<unsigned>(v));
            return { static_cast<int>(id / LEN), static_cast<int>(id % LEN) };
        }
        constexpr bits_proxy &operator++() {
            v = static_cast<shape_t>(v & (v - 1u));
            return *this;
        }
    };
    constexpr bits_proxy begin() const {
        return { value };
    }
    constexpr bits_proxy end() const {
        return { 0 };
    }
};

template <>
struct fmt::formatter<SymmetryGroup> : formatter<string_view> {
    auto format(SymmetryGroup c, format_context &ctx) const
        -> format_context::iterator;
};

template <>
struct fmt::formatter<Shape> : formatter<string_view> {
    auto format(Shape c, format_context &ctx) const
        -> format_context::iterator;
};
