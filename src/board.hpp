#pragma once

#include <cstddef>
#include <vector>

#include "Piece.hpp"

// occupancy grid of one search, addressed by y * width + x
class Board {
    size_t w, h;
    size_t open;
    std::vector<ssize_t> grid; // -1 = empty, otherwise the owning step

public:
    Board(size_t width, size_t height)
        : w{ width }, h{ height }, open{ width * height }, grid(width * height, -1) { }

    [[nodiscard]] size_t empty_cells() const { return open; }

    [[nodiscard]] bool contains(int y, int x) const {
        return y >= 0 && x >= 0
            && static_cast<size_t>(y) < h && static_cast<size_t>(x) < w;
    }

    [[nodiscard]] ssize_t at(int y, int x) const {
        return grid[y * w + x];
    }

    // every cell, shifted by tra, inside and empty
    [[nodiscard]] bool fits(const std::vector<coords_t> &cells, coords_t tra = { 0, 0 }) const {
        auto [dy, dx] = tra;
        for (auto [y, x] : cells)
            if (!contains(y + dy, x + dx) || at(y + dy, x + dx) != -1)
                return false;
        return true;
    }

    void place(const std::vector<coords_t> &cells, ssize_t owner) {
        for (auto [y, x] : cells)
            grid[y * w + x] = owner;
        open -= cells.size();
    }

    void remove(const std::vector<coords_t> &cells) {
        for (auto [y, x] : cells)
            grid[y * w + x] = -1;
        open += cells.size();
    }
};
