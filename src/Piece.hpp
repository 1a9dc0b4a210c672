#pragma once

#include "Shape.hpp"

#include <cstddef>
#include <string>
#include <type_traits>
#include <vector>

using ssize_t = std::make_signed_t<size_t>;

// one instance of a shape pinned to an orientation and a board offset
struct Placement {
    size_t shape_id, instance, trs_id;
    int x, y;
    std::vector<coords_t> cells; // on the board

    bool operator==(const Placement &other) const = default;
};

struct Piece {
    size_t id;

    Shape shape;

    struct Orientation {
        std::vector<coords_t> cells; // row-major, relative to the bounding box
        size_t height, width;
    };

    std::vector<Orientation> orientations;

    Piece(size_t i, Shape s);

    [[nodiscard]] size_t size() const { return shape.size(); }

    // func(const Orientation &, size_t trs, coords_t offset) -> bool, true stops the walk
    // visits every orientation at every offset that keeps it inside the board
    bool cover(size_t width, size_t height, auto &&func) const;

    [[nodiscard]] std::vector<Placement> placements(size_t instance, size_t width, size_t height) const;
};

class Library {
    std::vector<Piece> lib;

public:
    Library() = default;

    // throws parse_error on a duplicated id
    void push(size_t id, Shape sh);

    [[nodiscard]] const Piece *find(size_t id) const;
    // throws problem_error if id is unknown
    [[nodiscard]] const Piece &at(size_t id) const;

    [[nodiscard]] size_t size() const { return lib.size(); }
    [[nodiscard]] bool empty() const { return lib.empty(); }
    auto begin() const { return lib.begin(); }
    auto end() const { return lib.end(); }
};

struct Solution {
    std::vector<Placement> steps;

    explicit Solution(std::vector<Placement> st);

    // [y][x] => index into steps, -1 if uncovered
    [[nodiscard]] std::vector<std::vector<ssize_t>> map(size_t width, size_t height) const;

    // one line per row, '.' for uncovered cells, shape id otherwise
    [[nodiscard]] std::string render(size_t width, size_t height) const;
};
