#pragma once
#include <stdexcept>
#include <string>

namespace cfb {

/**
 The k-path text is too short, has a non-numeric segment length
 or an unmatched high-symmetry point
 */
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 An orbital, ion or type selection is empty or points outside of the data
 */
class IndexError : public std::out_of_range {
public:
    using std::out_of_range::out_of_range;
};

/**
 The shapes or counts of two related inputs don't agree, e.g. the per-type
 ion counts don't add up to the number of per-ion matrices
 */
class DimensionMismatchError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace cfb
