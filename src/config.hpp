#pragma once

#include <cstdint>
#include <functional>

#include "solver.hpp"

struct Config {
    Strategy strategy{ Strategy::SAT };
    bool verbose{};
    bool progress{}; // monitor thread on stderr
    unsigned jobs{ 1 };
    uint64_t max_steps{};
    unsigned timeout_ms{};

    // S=sat|bt|x V=<any> J=<threads> N=<steps> T=<ms>
    // throws config_error naming the offending variable
    static Config from(const std::function<const char *(const char *)> &lookup);
    static Config from_env();
};
