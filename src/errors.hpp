#pragma once

#include <stdexcept>
#include <string>

// malformed input text; fatal to the whole puzzle
struct parse_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// a region refers to a shape it cannot use; fatal to that region only
struct problem_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// the solver gave up before reaching a verdict
struct search_aborted : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct config_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};
