#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <algorithm>
#include <string_view>
#include <thread>

#include "errors.hpp"

template <typename T>
static T parse_number(const char *name, std::string_view sv) {
    T v{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (ec != std::errc{} || ptr != sv.data() + sv.size())
        throw config_error{ fmt::format("env {}: invalid number '{}'", name, sv) };
    return v;
}

Config Config::from(const std::function<const char *(const char *)> &lookup) {
    using namespace std::string_view_literals;

    auto get = [&](const char *name) -> std::string_view {
        auto v = lookup(name);
        return v ? v : "";
    };

    Config cfg;
    if (auto s = get("S"); s.empty() || s == "sat"sv)
        cfg.strategy = Strategy::SAT;
    else if (s == "bt"sv)
        cfg.strategy = Strategy::BACKTRACKING;
    else if (s == "x"sv)
        cfg.strategy = Strategy::CROSS_CHECK;
    else
        throw config_error{ fmt::format("env S: expected sat|bt|x, got '{}'", s) };

    cfg.verbose = !get("V").empty();
    cfg.progress = !cfg.verbose;

    if (auto j = get("J"); !j.empty())
        cfg.jobs = parse_number<unsigned>("J", j);
    if (!cfg.jobs)
        cfg.jobs = std::max(1u, std::thread::hardware_concurrency());
    if (auto n = get("N"); !n.empty())
        cfg.max_steps = parse_number<uint64_t>("N", n);
    if (auto t = get("T"); !t.empty())
        cfg.timeout_ms = parse_number<unsigned>("T", t);
    return cfg;
}

Config Config::from_env() {
    return from([](const char *name) -> const char * { return ::getenv(name); });
}
