#pragma once
#include "Config.hpp"
#include "dos/Dos.hpp"

namespace cfb {

/**
 Total and partial DOS curves ready for plotting against energy
 */
class DensityOfStates {
public:
    struct Curve {
        ArrayXd energy; ///< shifted energy of each bin
        ArrayXd dos; ///< DOS value of each bin

        bool empty() const { return dos.size() == 0; }
    };

public:
    explicit DensityOfStates(DosCollection dos) : data(std::move(dos)) {}

    DosCollection const& get_data() const { return data; }

    /// Total DOS
    Curve total(DosConfig const& config) const;
    /// Fermi level with the configured shift applied
    double fermi(DosConfig const& config) const { return data.get_fermi() + config.energy_shift; }

    /**
     Summed pDOS of one orbital of one ion type

     Returns an empty curve if pDOS is disabled or if there is no per-ion data.
     */
    Curve partial(DosConfig const& config) const;

    /// Per-type (orbital, energy-bin) pDOS matrices for all types
    std::vector<ArrayXXd> typed(DosConfig const& config) const;

private:
    DosCollection data;
};

} // namespace cfb
