#pragma once
#include "projection/ProjectionTensor.hpp"

#include <string>
#include <vector>

namespace kpoints {

/// Line-mode KPOINTS text for the path G -> X -> M with 40 points per segment
std::string gamma_x_m();

/// Split text into lines (without the line endings)
std::vector<std::string> lines(std::string const& text);

} // namespace kpoints

namespace projections {

/// Every orbital on every ion has the same weight, adds up to 1 per (k-point, band)
cfb::ProjectionTensor uniform(cfb::idx_t norb, cfb::idx_t nion, cfb::idx_t nkpt, cfb::idx_t nband);

/// Reproducible random weights which are normalized to 1 per (k-point, band)
cfb::ProjectionTensor random_complete(cfb::idx_t norb, cfb::idx_t nion,
                                      cfb::idx_t nkpt, cfb::idx_t nband);

/// Per-ion (orbital, energy-bin) matrices: every element of ion `n` equals `n + 1`
std::vector<cfb::ArrayXXd> per_ion_pdos(cfb::idx_t nion, cfb::idx_t norb, cfb::idx_t nbins);

} // namespace projections
