#include "puzzle.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <numeric>
#include <sstream>
#include <string>

#include "errors.hpp"

size_t Region::pieces() const {
    return std::accumulate(counts.begin(), counts.end(), 0zu);
}

static std::string_view trim(std::string_view sv) {
    auto ws = " \t\r";
    auto b = sv.find_first_not_of(ws);
    if (b == std::string_view::npos)
        return {};
    auto e = sv.find_last_not_of(ws);
    return sv.substr(b, e - b + 1);
}

static std::vector<std::string_view> split(std::string_view sv, char sep) {
    std::vector<std::string_view> out;
    for (size_t pos; (pos = sv.find(sep)) != std::string_view::npos; sv.remove_prefix(pos + 1))
        out.push_back(sv.substr(0, pos));
    out.push_back(sv);
    return out;
}

static size_t parse_size(std::string_view sv, size_t line, std::string_view what) {
    size_t v{};
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size())
        throw parse_error{ fmt::format("Line {}: invalid {} '{}'", line, what, sv) };
    return v;
}

static Region parse_region(std::string_view line, size_t no) {
    auto parts = split(line, ':');
    if (parts.size() != 2)
        throw parse_error{ fmt::format("Line {}: invalid problem space format", no) };

    auto dims = split(trim(parts[0]), 'x');
    if (dims.size() != 2)
        throw parse_error{ fmt::format("Line {}: invalid dimensions format, expected 'WxH'", no) };

    Region r{ parse_size(dims[0], no, "width"), parse_size(dims[1], no, "height"), {} };
    // board cells are addressed with int coordinates and a size_t index
    constexpr size_t max_side = std::numeric_limits<int>::max();
    if (r.width > max_side || r.height > max_side
            || (r.height && r.width > std::numeric_limits<size_t>::max() / r.height))
        throw parse_error{ fmt::format("Line {}: dimensions {}x{} too large", no, r.width, r.height) };
    std::istringstream ss{ std::string{ trim(parts[1]) } };
    for (std::string tok; ss >> tok;)
        r.counts.push_back(parse_size(tok, no, "shape count"));
    return r;
}

Puzzle parse_puzzle(std::string_view text) {
    std::vector<std::string_view> lines = split(text, '\n');
    while (!lines.empty() && trim(lines.back()).empty())
        lines.pop_back();

    Puzzle pz;
    for (auto i = 0zu; i < lines.size();) {
        auto line = trim(lines[i]);
        if (line.empty()) {
            i++;
        } else if (line.ends_with(':') && line.find('x') == std::string_view::npos) {
            auto id = parse_size(line.substr(0, line.size() - 1), i + 1, "shape ID");
            if (i + Shape::LEN >= lines.size())
                throw parse_error{ fmt::format("Line {}: shape {} incomplete, expected {} grid lines",
                        i + 1, id, Shape::LEN) };
            std::vector<std::string> rows;
            for (auto j = 1zu; j <= Shape::LEN; j++) {
                auto row = trim(lines[i + j]);
                if (row.size() != Shape::LEN)
                    throw parse_error{ fmt::format(
                            "Line {}: shape {} grid line {} should be {} characters, got '{}'",
                            i + j + 1, id, j, Shape::LEN, row) };
                rows.emplace_back(row);
            }
            try {
                pz.shapes.push(id, Shape::from_rows(rows));
            } catch (const parse_error &e) {
                throw parse_error{ fmt::format("Line {}: {}", i + 1, e.what()) };
            }
            i += Shape::LEN + 1;
        } else if (line.find('x') != std::string_view::npos
                && line.find(':') != std::string_view::npos) {
            pz.regions.push_back(parse_region(line, i + 1));
            i++;
        } else {
            throw parse_error{ fmt::format("Line {}: unexpected format '{}'", i + 1, line) };
        }
    }
    return pz;
}

Puzzle load_puzzle(const std::filesystem::path &path) {
    std::ifstream fin(path);
    if (!fin)
        throw parse_error{ fmt::format("Failed to read file: {}", path.string()) };
    std::stringstream buffer;
    buffer << fin.rdbuf();
    return parse_puzzle(buffer.str());
}
