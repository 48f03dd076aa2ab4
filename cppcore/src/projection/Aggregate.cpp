#include "projection/Aggregate.hpp"

#include "support/errors.hpp"
#include "support/format.hpp"
#include "utils/Log.hpp"

#include <numeric>

namespace cfb {

namespace {
    /// All the per-ion matrices must be summable element-wise
    void check_same_shape(std::vector<ArrayXXd> const& per_ion) {
        if (per_ion.empty()) { return; }

        auto const& first = per_ion.front();
        for (auto n = std::size_t{1}; n < per_ion.size(); ++n) {
            if (!same_shape(per_ion[n], first)) {
                throw DimensionMismatchError(fmt::format(
                    "The pDOS of ion {} has shape ({}, {}), expected ({}, {}) like ion 0",
                    n, per_ion[n].rows(), per_ion[n].cols(), first.rows(), first.cols()
                ));
            }
        }
    }

    ArrayXXd zeros_like(std::vector<ArrayXXd> const& per_ion) {
        return per_ion.empty() ? ArrayXXd() : ArrayXXd::Zero(per_ion.front().rows(),
                                                             per_ion.front().cols()).eval();
    }
} // anonymous namespace

ArrayXXd fat_weight(ProjectionTensor const& tensor, OrbitalSelection const& orbitals,
                    IonSelection const& ions) {
    orbitals.validate(tensor.num_orbitals());
    ions.validate(tensor.num_ions());

    auto result = ArrayXXd::Zero(tensor.num_kpoints(), tensor.num_bands()).eval();
    for (auto const orbital : orbitals) {
        for (auto const ion : ions) {
            result += tensor.slab(orbital, ion);
        }
    }
    return result;
}

ArrayXXd total_weight(ProjectionTensor const& tensor) {
    return fat_weight(tensor, OrbitalSelection::all(tensor.num_orbitals()),
                      IonSelection::all(tensor.num_ions()));
}

std::vector<ArrayXXd> typed_pdos(std::vector<ArrayXXd> const& per_ion,
                                 std::vector<idx_t> const& counts_per_type) {
    auto const num_ions = static_cast<idx_t>(per_ion.size());
    auto const total = std::accumulate(counts_per_type.begin(), counts_per_type.end(), idx_t{0});
    if (total != num_ions) {
        throw DimensionMismatchError(fmt::format(
            "The ion counts per type add up to {}, but the pDOS has {} ions", total, num_ions
        ));
    }
    if (std::any_of(counts_per_type.begin(), counts_per_type.end(),
                    [](idx_t n) { return n < 0; })) {
        throw DimensionMismatchError("The ion count of a type can't be negative");
    }
    check_same_shape(per_ion);

    auto result = std::vector<ArrayXXd>();
    result.reserve(counts_per_type.size());

    auto cursor = idx_t{0}; // next unassigned ion
    for (auto const count : counts_per_type) {
        auto sum = zeros_like(per_ion);
        for (auto const end = cursor + count; cursor < end; ++cursor) {
            sum += per_ion[static_cast<std::size_t>(cursor)];
        }
        result.push_back(std::move(sum));
    }

    Log::d(fmt::format("pDOS: summed {} ions into {} types", num_ions, result.size()));
    return result;
}

std::vector<ArrayXXd> typed_pdos(std::vector<ArrayXXd> const& per_ion, IonTypes const& types) {
    auto const num_ions = static_cast<idx_t>(per_ion.size());
    if (types.num_ions() != num_ions) {
        throw DimensionMismatchError(fmt::format(
            "The ion types cover {} ions, but the pDOS has {} ions", types.num_ions(), num_ions
        ));
    }
    check_same_shape(per_ion);

    // Explicit ion lists are claimed first, count-only types then fill the remaining
    // ions in order. Each ion must end up with exactly one owner.
    auto owner = std::vector<idx_t>(per_ion.size(), -1);
    for (auto t = idx_t{0}; t < types.size(); ++t) {
        for (auto const ion : types[t].ions) {
            if (ion < 0 || ion >= num_ions) {
                throw IndexError(fmt::format("Ion type '{}': ion index {} is out of range [0, {})",
                                             types[t].name, ion, num_ions));
            }

            auto& current = owner[static_cast<std::size_t>(ion)];
            if (current >= 0) {
                throw DimensionMismatchError(fmt::format(
                    "Ion {} is claimed by both '{}' and '{}'", ion, types[current].name,
                    types[t].name
                ));
            }
            current = t;
        }
    }

    auto result = std::vector<ArrayXXd>();
    result.reserve(static_cast<std::size_t>(types.size()));

    auto cursor = idx_t{0}; // next ion which may still be unassigned
    for (auto t = idx_t{0}; t < types.size(); ++t) {
        auto const& type = types[t];
        auto sum = zeros_like(per_ion);

        if (type.is_explicit()) {
            for (auto const ion : type.ions) {
                sum += per_ion[static_cast<std::size_t>(ion)];
            }
        } else {
            for (auto taken = idx_t{0}; taken < type.count; ++cursor) {
                // the totals match, so the count-only types can't run past the end
                auto& current = owner[static_cast<std::size_t>(cursor)];
                if (current >= 0) { continue; }

                current = t;
                sum += per_ion[static_cast<std::size_t>(cursor)];
                ++taken;
            }
        }
        result.push_back(std::move(sum));
    }

    Log::d(fmt::format("pDOS: summed {} ions into {} named types", num_ions, result.size()));
    return result;
}

ArrayXd pdos_curve(std::vector<ArrayXXd> const& typed, idx_t type_index, idx_t orbital_index) {
    auto const num_types = static_cast<idx_t>(typed.size());
    if (type_index < 0 || type_index >= num_types) {
        throw IndexError(fmt::format("The type index {} is out of range [0, {})",
                                     type_index, num_types));
    }

    auto const& pdos = typed[static_cast<std::size_t>(type_index)];
    if (orbital_index < 0 || orbital_index >= pdos.rows()) {
        throw IndexError(fmt::format("The orbital index {} is out of range [0, {})",
                                     orbital_index, pdos.rows()));
    }
    return pdos.row(orbital_index).transpose();
}

} // namespace cfb
