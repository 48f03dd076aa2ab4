#pragma once
#include "projection/ProjectionTensor.hpp"
#include "projection/Selection.hpp"

#include <vector>

namespace cfb {

/**
 Fatband weights: the projected weight of the selected orbitals on the selected ions

 For every (k-point, band) pair, sum `tensor(orbital, ion, k-point, band)` over all
 `orbital` in `orbitals` and `ion` in `ions`. The result has the (k-point, band) shape
 of the tensor and is used as a marker size or intensity scale.

 Throws `IndexError` if a selection is empty or out of range of the tensor.
 The caller is responsible for skipping this when there is no projection data.
 */
ArrayXXd fat_weight(ProjectionTensor const& tensor, OrbitalSelection const& orbitals,
                    IonSelection const& ions);

/// Total projected weight per (k-point, band) -- close to 1 for a complete projection
ArrayXXd total_weight(ProjectionTensor const& tensor);

/**
 Per-type partial DOS: element-wise sums of the per-ion (orbital, energy-bin) matrices

 `per_ion` is split into contiguous runs of `counts_per_type[0]`, `counts_per_type[1]`, ...
 matrices and each run is summed. The ions in `per_ion` must be ordered the same way
 as the types are declared: this can't be verified here, a mismatched order gives
 wrong sums instead of an error. Use the `IonTypes` overload with explicit ion lists
 to make the assignment checkable.

 Throws `DimensionMismatchError` if the counts don't add up to `per_ion.size()`
 or if the matrices don't all have the same shape.
 */
std::vector<ArrayXXd> typed_pdos(std::vector<ArrayXXd> const& per_ion,
                                 std::vector<idx_t> const& counts_per_type);

/**
 Per-type partial DOS with named types

 Types with explicit ion indices sum exactly those ions. Count-only types take the
 next ions in order, skipping none. Throws `IndexError` for an explicit ion index
 outside of `per_ion` and `DimensionMismatchError` if an ion is claimed by more than
 one type or if the total doesn't match `per_ion.size()`.
 */
std::vector<ArrayXXd> typed_pdos(std::vector<ArrayXXd> const& per_ion, IonTypes const& types);

/// A single curve of a per-type pDOS: `typed[type_index].row(orbital_index)`
ArrayXd pdos_curve(std::vector<ArrayXXd> const& typed, idx_t type_index, idx_t orbital_index);

} // namespace cfb
