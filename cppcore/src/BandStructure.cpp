#include "BandStructure.hpp"

#include "projection/Aggregate.hpp"
#include "support/errors.hpp"
#include "support/format.hpp"
#include "utils/Log.hpp"

namespace cfb {

BandStructure::BandStructure(KPath kpath_, ArrayXXd energies, ProjectionTensor projections_)
    : kpath(std::move(kpath_)), band_energies(std::move(energies)),
      projections(std::move(projections_)) {
    if (band_energies.rows() != kpath.num_kpoints()) {
        throw DimensionMismatchError(fmt::format(
            "The band energies have {} k-points, but the path needs {} segments x {} points = {}",
            band_energies.rows(), kpath.num_segments(), kpath.segment_length, kpath.num_kpoints()
        ));
    }

    if (has_projections() && (projections.num_kpoints() != num_kpoints()
                              || projections.num_bands() != num_bands())) {
        throw DimensionMismatchError(fmt::format(
            "The projections have shape ({}, {}) in (k-point, band), "
            "but the energies have ({}, {})", projections.num_kpoints(),
            projections.num_bands(), num_kpoints(), num_bands()
        ));
    }
}

BandStructure::Ticks BandStructure::ticks() const {
    return {kpath.tick_positions(num_kpoints()), kpath.tick_labels};
}

ArrayXXd BandStructure::energies(BandConfig const& config) const {
    return shifted(band_energies, config.energy_shift);
}

ArrayXXd BandStructure::fat_weights(BandConfig const& config) const {
    if (!config.fatbands) {
        return {};
    }
    if (!has_projections()) {
        Log::w("Fatbands were requested, but there is no projection data -- skipping");
        return {};
    }
    return fat_weight(projections, config.orbitals, config.ions);
}

} // namespace cfb
