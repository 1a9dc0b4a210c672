#pragma once

#include "Piece.hpp"

bool Piece::cover(size_t width, size_t height, auto &&func) const {
    for (auto trs = 0zu; trs < orientations.size(); trs++) {
        auto &o = orientations[trs];
        for (auto y = 0zu; y < height && y + o.height <= height; y++)
            for (auto x = 0zu; x < width && x + o.width <= width; x++)
                if (func(o, trs, coords_t{ static_cast<int>(y), static_cast<int>(x) }))
                    return true;
    }
    return false;
}
