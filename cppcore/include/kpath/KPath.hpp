#pragma once
#include "detail/config.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace cfb {

/**
 Path through the high-symmetry points of reciprocal space (line-mode KPOINTS)

 Each segment of the path is sampled with `segment_length` k-points. The file lists
 the start and end point of every segment, so an endpoint shared by two adjacent
 segments appears twice in `raw_labels`. `tick_labels` has one entry per x-axis tick:
 shared endpoints are merged into a single label and path jumps are written as "A | B".
 */
struct KPath {
    int segment_length; ///< number of k-points per segment, constant along the whole path
    std::vector<std::string> raw_labels; ///< as listed in the file, always an even number
    std::vector<std::string> tick_labels; ///< merged, `raw_labels.size() / 2 + 1` entries

    /// Number of high-symmetry entries in the file (including repeated endpoints)
    idx_t num_raw_labels() const { return static_cast<idx_t>(raw_labels.size()); }
    /// Number of straight segments along the path
    idx_t num_segments() const { return num_raw_labels() / 2; }
    /// Total number of k-points sampled along the path
    idx_t num_kpoints() const { return num_segments() * segment_length; }

    /**
     1-based x-axis positions of the ticks: `1, L, 2L, ..., n*L` for `L = segment_length`

     The k-point count of the band data must match the path exactly, otherwise
     `DimensionMismatchError` is thrown.
     */
    std::vector<idx_t> tick_positions(idx_t num_kpoints) const;

    /// Positions `L, 2L, ..., n*L` where one segment ends and the next one starts
    std::vector<idx_t> segment_boundaries() const;
};

/**
 Merge the raw high-symmetry labels into x-axis tick labels

 The first and last labels are kept verbatim. Each interior pair is either merged
 (equal labels) or joined with " | " (a discontinuous jump in reciprocal space).
 Throws `FormatError` if the number of labels is zero or odd.
 */
std::vector<std::string> merge_tick_labels(std::vector<std::string> const& raw_labels);

/**
 Parse the text lines of a line-mode KPOINTS file

 Line 1 is a comment, the first token of line 2 is the segment length and lines 3-4
 hold the mode markers. Every following line with exactly 5 whitespace-separated
 fields (`x y z weight label`) contributes its label. Blank and other lines are skipped.
 */
KPath parse_kpath(std::vector<std::string> const& lines);

/// Read all the lines of `stream` and parse them, see above
KPath parse_kpath(std::istream& stream);

/// Open, parse and close a KPOINTS file -- throws `FormatError` if it can't be read
KPath read_kpath(std::string const& filename);

} // namespace cfb
