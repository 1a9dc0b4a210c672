#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Shape.hpp"

inline Shape shape(std::string r0, std::string r1, std::string r2) {
    return Shape::from_rows({ std::move(r0), std::move(r1), std::move(r2) });
}

inline constexpr std::string_view EXAMPLE = R"(0:
###
##.
##.

1:
###
##.
.##

2:
.##
###
##.

3:
##.
###
##.

4:
###
#..
###

5:
###
.#.
###

4x4: 0 0 0 0 2 0
12x5: 1 0 1 0 2 2
12x5: 1 0 1 0 3 2
)";
