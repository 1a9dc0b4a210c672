#pragma once

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include "Piece.hpp"

// a board plus how many instances of each shape must go into it
struct Region {
    size_t width, height;
    std::vector<size_t> counts; // [shape id] => instances

    [[nodiscard]] size_t area() const { return width * height; }
    [[nodiscard]] size_t pieces() const;
};

struct Puzzle {
    Library shapes;
    std::vector<Region> regions;
};

// throws parse_error carrying the 1-based line number
Puzzle parse_puzzle(std::string_view text);
Puzzle load_puzzle(const std::filesystem::path &path);
