#pragma once
#include "projection/Selection.hpp"

namespace cfb {

/**
 Band structure plot data configuration with defaults
 */
struct BandConfig {
    double energy_shift = 0.0; ///< added to all energies, e.g. the alpha+beta term of the OUTCAR
    bool fatbands = false; ///< compute fatband weights (requires projection data)
    OrbitalSelection orbitals; ///< orbitals which contribute to the fatband weight
    IonSelection ions; ///< ions which contribute to the fatband weight
};

/**
 DOS plot data configuration with defaults
 */
struct DosConfig {
    double energy_shift = 0.0; ///< added to all energies and to the Fermi level
    bool pdos = false; ///< compute a partial DOS curve (requires per-ion data)
    IonTypes ion_types; ///< partition of the ions into types, in structure order
    idx_t type_to_plot = 0; ///< index into `ion_types`
    idx_t orbital_to_plot = 0; ///< row of the per-type (orbital, energy-bin) matrix
};

} // namespace cfb
