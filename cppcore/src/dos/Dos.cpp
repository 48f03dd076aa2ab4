#include "dos/Dos.hpp"

#include "support/errors.hpp"
#include "support/format.hpp"

namespace cfb {

DosCollection::DosCollection(ArrayXd energy_, ArrayXd total_, double fermi,
                             std::vector<ArrayXXd> per_ion_, ArrayXd integrated_)
    : energy(std::move(energy_)), total(std::move(total_)), integrated(std::move(integrated_)),
      fermi(fermi), per_ion(std::move(per_ion_)) {
    if (total.size() != energy.size()) {
        throw DimensionMismatchError(fmt::format("DOS: {} total DOS values for {} energy bins",
                                                 total.size(), energy.size()));
    }
    if (integrated.size() != 0 && integrated.size() != energy.size()) {
        throw DimensionMismatchError(fmt::format("DOS: {} integrated DOS values for {} energy bins",
                                                 integrated.size(), energy.size()));
    }

    for (auto n = std::size_t{0}; n < per_ion.size(); ++n) {
        auto const& m = per_ion[n];
        if (m.cols() != energy.size() || m.rows() != per_ion.front().rows()) {
            throw DimensionMismatchError(fmt::format(
                "DOS: the pDOS of ion {} has shape ({}, {}), expected ({}, {})",
                n, m.rows(), m.cols(), per_ion.front().rows(), energy.size()
            ));
        }
    }
}

double energy_at_electron_count(DosCollection const& dos, double electron_count) {
    auto const& n = dos.get_integrated();
    auto const& e = dos.get_energy();
    if (n.size() < 2) {
        throw DimensionMismatchError("DOS: the integrated DOS is needed to find "
                                     "the energy at an electron count");
    }
    if (!(electron_count >= n[0] && electron_count <= n[n.size() - 1])) {
        throw std::out_of_range(fmt::format("Electron count invalid: {} is outside of [{}, {}]",
                                            electron_count, n[0], n[n.size() - 1]));
    }

    auto i = idx_t{1};
    while (n[i] < electron_count) {
        ++i;
    }

    // linear interpolation between bins i-1 and i
    auto const slope = (n[i] - n[i - 1]) / (e[i] - e[i - 1]);
    if (slope == 0) {
        return e[i - 1]; // no states between the two bins
    }
    auto const intercept = n[i] - slope * e[i];
    return (electron_count - intercept) / slope;
}

} // namespace cfb
