#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "puzzle.hpp"
#include "solver.hpp"

enum class Verdict {
    SOLVED,
    UNSOLVABLE,
    UNKNOWN, // solver gave up
    ERROR, // malformed region or strategy disagreement
};

struct Outcome {
    Verdict verdict{ Verdict::ERROR };
    std::optional<Solution> solution;
    std::string message;
    uint64_t us{};

    // filled in by the solver hooks
    size_t variables{}, clauses{};
    uint64_t placed{};
};

struct Report {
    std::vector<Outcome> outcomes; // [region index]
    size_t solved{}, unsolvable{}, unknown{}, errors{};
    uint64_t us{};

    // "<solved> / <total> regions solved"
    [[nodiscard]] std::string summary() const;
};

// regions are solved independently, on cfg.jobs workers when cfg.jobs > 1
Report run_batch(const Puzzle &pz, const Config &cfg);
