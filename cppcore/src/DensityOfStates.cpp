#include "DensityOfStates.hpp"

#include "projection/Aggregate.hpp"
#include "utils/Log.hpp"

namespace cfb {

DensityOfStates::Curve DensityOfStates::total(DosConfig const& config) const {
    return {shifted(data.get_energy(), config.energy_shift), data.get_total()};
}

DensityOfStates::Curve DensityOfStates::partial(DosConfig const& config) const {
    if (!config.pdos) {
        return {};
    }
    if (!data.has_projections()) {
        Log::w("Projected DOS was requested, but the DOS has no per-ion data -- skipping");
        return {};
    }

    auto const pdos = typed(config);
    return {shifted(data.get_energy(), config.energy_shift),
            pdos_curve(pdos, config.type_to_plot, config.orbital_to_plot)};
}

std::vector<ArrayXXd> DensityOfStates::typed(DosConfig const& config) const {
    return typed_pdos(data.get_per_ion(), config.ion_types);
}

} // namespace cfb
