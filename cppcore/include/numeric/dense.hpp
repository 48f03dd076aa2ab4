#pragma once
#include "detail/config.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <vector>

namespace cfb {

// add common Eigen types to the global namespace
using Eigen::DenseBase;
using Eigen::ArrayXd;
using Eigen::ArrayXXd;

/// Read-only view of a (rows x cols) block of contiguous row-major data
using ArrayXXdConstMap = Eigen::Map<ArrayXXd const>;

/// Do two arrays have exactly the same number of rows and columns?
template<class DerivedA, class DerivedB>
inline bool same_shape(DenseBase<DerivedA> const& a, DenseBase<DerivedB> const& b) {
    return a.rows() == b.rows() && a.cols() == b.cols();
}

/// Add `shift` to every element, e.g. to move energies relative to a reference level
template<class Derived>
inline auto shifted(DenseBase<Derived> const& v, double shift)
    -> decltype((v.derived().array() + shift).eval()) {
    return (v.derived().array() + shift).eval();
}

} // namespace cfb
