#include "kpath/KPath.hpp"

#include "detail/algorithm.hpp"
#include "support/errors.hpp"
#include "support/format.hpp"
#include "utils/Log.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

namespace cfb {

namespace {
    /// Number of header lines before the first k-point entry
    constexpr auto header_size = std::size_t{4};
    /// A k-point entry: `x y z weight label`
    constexpr auto kpoint_fields = std::size_t{5};

    std::vector<std::string> split_whitespace(std::string const& line) {
        auto stream = std::istringstream(line);
        return {std::istream_iterator<std::string>(stream), std::istream_iterator<std::string>()};
    }

    int parse_segment_length(std::string const& line) {
        auto const fields = split_whitespace(line);
        if (fields.empty()) {
            throw FormatError("KPOINTS: line 2 must start with the number of points per segment");
        }

        auto const& token = fields.front();
        auto value = 0;
        auto consumed = std::size_t{0};
        try {
            value = std::stoi(token, &consumed);
        } catch (std::logic_error const&) { // std::invalid_argument or std::out_of_range
            consumed = 0;
        }

        if (consumed != token.size()) {
            throw FormatError(fmt::format("KPOINTS: the number of points per segment must be "
                                          "an integer, got '{}'", token));
        }
        if (value <= 0) {
            throw FormatError(fmt::format("KPOINTS: the number of points per segment must be "
                                          "positive, got {}", value));
        }
        return value;
    }
} // anonymous namespace

std::vector<idx_t> KPath::tick_positions(idx_t num_kpoints) const {
    if (num_kpoints != this->num_kpoints()) {
        throw DimensionMismatchError(fmt::format(
            "The band data has {} k-points, but the path needs {} segments x {} points = {}",
            num_kpoints, num_segments(), segment_length, this->num_kpoints()
        ));
    }

    auto positions = std::vector<idx_t>{1};
    auto const boundaries = segment_boundaries();
    positions.insert(positions.end(), boundaries.begin(), boundaries.end());
    return positions;
}

std::vector<idx_t> KPath::segment_boundaries() const {
    auto boundaries = std::vector<idx_t>();
    boundaries.reserve(static_cast<std::size_t>(num_segments()));
    for (auto n = idx_t{1}; n <= num_segments(); ++n) {
        boundaries.push_back(n * segment_length);
    }
    return boundaries;
}

std::vector<std::string> merge_tick_labels(std::vector<std::string> const& raw_labels) {
    if (raw_labels.empty()) {
        throw FormatError("KPOINTS: no high-symmetry points were found");
    }
    if (raw_labels.size() % 2 != 0) {
        throw FormatError(fmt::format("KPOINTS: found {} high-symmetry points, but every segment "
                                      "needs a start and an end point", raw_labels.size()));
    }

    auto ticks = std::vector<std::string>();
    ticks.reserve(raw_labels.size() / 2 + 1);
    ticks.push_back(raw_labels.front());

    // end point of one segment + start point of the next one
    auto const interior = std::vector<std::string>(raw_labels.begin() + 1, raw_labels.end() - 1);
    for (auto const& pair : sliced(interior, 2)) {
        auto const& end = *pair.begin();
        auto const& start = *(pair.begin() + 1);
        ticks.push_back(end == start ? end : end + " | " + start);
    }

    ticks.push_back(raw_labels.back());
    return ticks;
}

KPath parse_kpath(std::vector<std::string> const& lines) {
    if (lines.size() < header_size) {
        throw FormatError(fmt::format("KPOINTS: expected at least {} header lines, got {}",
                                      header_size, lines.size()));
    }

    auto const segment_length = parse_segment_length(lines[1]);

    auto raw_labels = std::vector<std::string>();
    for (auto it = lines.begin() + header_size; it != lines.end(); ++it) {
        auto const fields = split_whitespace(*it);
        if (fields.size() == kpoint_fields) {
            raw_labels.push_back(fields.back());
        }
    }

    auto tick_labels = merge_tick_labels(raw_labels);
    Log::d(fmt::format("KPOINTS: {} points per segment, ticks [{}]",
                       segment_length, fmt::quoted_list(tick_labels)));
    return {segment_length, std::move(raw_labels), std::move(tick_labels)};
}

KPath parse_kpath(std::istream& stream) {
    auto lines = std::vector<std::string>();
    for (auto line = std::string(); std::getline(stream, line);) {
        lines.push_back(line);
    }
    if (stream.bad()) {
        throw FormatError("KPOINTS: read error");
    }
    return parse_kpath(lines);
}

KPath read_kpath(std::string const& filename) {
    auto file = std::ifstream(filename);
    if (!file) {
        throw FormatError(fmt::format("KPOINTS: can't open '{}'", filename));
    }
    return parse_kpath(file);
}

} // namespace cfb
