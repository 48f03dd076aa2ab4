#pragma once
#include "numeric/dense.hpp"

#include <vector>

namespace cfb {

/**
 Density of states as delivered by an external DOSCAR decoder

 All series are indexed by energy bin. `per_ion` holds one (orbital, energy-bin)
 matrix per ion, in the order the ions appear in the structure.
 */
class DosCollection {
public:
    DosCollection() = default;
    /// Throws `DimensionMismatchError` if the series don't share the same energy bins
    DosCollection(ArrayXd energy, ArrayXd total, double fermi,
                  std::vector<ArrayXXd> per_ion = {}, ArrayXd integrated = {});

    ArrayXd const& get_energy() const { return energy; }
    ArrayXd const& get_total() const { return total; }
    /// Integrated total DOS (number of electrons below each energy), may be empty
    ArrayXd const& get_integrated() const { return integrated; }
    std::vector<ArrayXXd> const& get_per_ion() const { return per_ion; }
    double get_fermi() const { return fermi; }

    idx_t num_bins() const { return energy.size(); }
    idx_t num_ions() const { return static_cast<idx_t>(per_ion.size()); }
    /// Are there projected (per-ion) DOS matrices?
    bool has_projections() const { return !per_ion.empty(); }

private:
    ArrayXd energy;
    ArrayXd total;
    ArrayXd integrated;
    double fermi = 0;
    std::vector<ArrayXXd> per_ion;
};

/**
 Estimate the Fermi level for a hypothetical number of electrons

 Finds the first energy bin where the integrated DOS reaches `electron_count` and
 interpolates linearly between it and the previous bin. Throws `std::out_of_range`
 if the count is outside of the integrated DOS range.
 */
double energy_at_electron_count(DosCollection const& dos, double electron_count);

} // namespace cfb
