#pragma once
#include "Config.hpp"
#include "kpath/KPath.hpp"
#include "projection/ProjectionTensor.hpp"

#include <string>
#include <vector>

namespace cfb {

/**
 Everything a renderer needs to draw a (fat)band structure along a k-path

 The band energies are indexed by (k-point, band). The projection tensor is optional:
 leave it empty if the calculation didn't produce orbital projections.
 */
class BandStructure {
public:
    struct Ticks {
        std::vector<idx_t> positions; ///< 1-based k-point positions
        std::vector<std::string> labels;
    };

public:
    /// Throws `DimensionMismatchError` if the energies, projections and path don't agree
    BandStructure(KPath kpath, ArrayXXd energies, ProjectionTensor projections = {});

    KPath const& get_kpath() const { return kpath; }
    ProjectionTensor const& get_projections() const { return projections; }

    idx_t num_kpoints() const { return band_energies.rows(); }
    idx_t num_bands() const { return band_energies.cols(); }
    bool has_projections() const { return !projections.empty(); }

    /// x-axis ticks: one position per merged high-symmetry label
    Ticks ticks() const;
    /// k-point positions where vertical separators are drawn between segments
    std::vector<idx_t> separators() const { return kpath.segment_boundaries(); }

    /// Band energies with the configured shift applied, (k-point, band)
    ArrayXXd energies(BandConfig const& config) const;
    /// Fermi level with the configured shift applied
    double fermi(double fermi_energy, BandConfig const& config) const {
        return fermi_energy + config.energy_shift;
    }

    /**
     Fatband marker weights, (k-point, band)

     Returns an empty array if fatbands are disabled or if there is no projection data.
     */
    ArrayXXd fat_weights(BandConfig const& config) const;

private:
    KPath kpath;
    ArrayXXd band_energies;
    ProjectionTensor projections;
};

} // namespace cfb
