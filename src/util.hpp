#pragma once

#include <concepts>
#include <cstdint>
#include <string>

#include <fmt/format.h>

template <std::integral T>
inline std::string display(T n) {
    if (n < 1000ull)
        return fmt::format("{}", n);
    if (n < 1000 * 1000ull)
        return fmt::format("{:.2f}K", n / 1e3);
    if (n < 1000 * 1000ull * 1000ull)
        return fmt::format("{:.2f}M", n / 1e6);
    return fmt::format("{:.2f}G", n / 1e9);
}

inline std::string display(double s) {
    if (s == 0.0)
        return "0s";
    if (s < 0.0)
        return "-" + display(-s);
    if (s < 1e-6)
        return fmt::format("<1us");
    if (s < 1e-3)
        return fmt::format("{:.1f}us", s / 1e-6);
    if (s < 1.0)
        return fmt::format("{:.1f}ms", s / 1e-3);
    if (s < 100.0)
        return fmt::format("{:.2f}s", s);
    if (s < 600.0)
        return fmt::format("{}m{}s", (uint64_t)(s) / 60, (uint64_t)(s) % 60);
    if (s < 3600.0)
        return fmt::format("{:.1f}m", s / 60);
    return fmt::format("{}h{}m", (uint64_t)(s) / 3600, (uint64_t)(s) / 60 % 60);
}
