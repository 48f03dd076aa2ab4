#pragma once
#include <cstddef>

// The build also sets these on the cppcore target so that code which includes
// <Eigen/Core> before any cfb header sees the same configuration.
#ifndef EIGEN_DONT_PARALLELIZE
# define EIGEN_DONT_PARALLELIZE // the reductions are small, threading only adds overhead
#endif
#ifndef EIGEN_DEFAULT_DENSE_INDEX_TYPE
# define EIGEN_DEFAULT_DENSE_INDEX_TYPE std::ptrdiff_t
#endif
#ifndef EIGEN_DEFAULT_TO_ROW_MAJOR
# define EIGEN_DEFAULT_TO_ROW_MAJOR // (k-point, band) slabs map directly onto the flat tensor buffer
#endif

namespace cfb {
    using idx_t = std::ptrdiff_t; // type for general indexing and interfaces
}
