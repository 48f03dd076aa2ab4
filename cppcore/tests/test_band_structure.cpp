#include <catch2/catch.hpp>

#include "BandStructure.hpp"
#include "DensityOfStates.hpp"
#include "projection/Aggregate.hpp"
#include "support/errors.hpp"
#include "fixtures.hpp"
using namespace cfb;

namespace {
    using Positions = std::vector<idx_t>;
    using Labels = std::vector<std::string>;

    KPath short_path() {
        // G -> X -> M with 4 points per segment
        return {4, {"G", "X", "X", "M"}, {"G", "X", "M"}};
    }
}

TEST_CASE("Band structure") {
    auto const energies = ArrayXXd::Constant(8, 3, -6.0).eval();
    auto const tensor = projections::random_complete(9, 2, 8, 3);
    auto const bands = BandStructure(short_path(), energies, tensor);

    REQUIRE(bands.num_kpoints() == 8);
    REQUIRE(bands.num_bands() == 3);
    REQUIRE(bands.has_projections());

    SECTION("Ticks") {
        auto const ticks = bands.ticks();
        REQUIRE_THAT(ticks.positions, Catch::Equals(Positions{1, 4, 8}));
        REQUIRE_THAT(ticks.labels, Catch::Equals(Labels{"G", "X", "M"}));
        REQUIRE_THAT(bands.separators(), Catch::Equals(Positions{4, 8}));
    }

    SECTION("Energies") {
        auto config = BandConfig();
        REQUIRE(bands.energies(config).isApprox(energies));

        config.energy_shift = -12.041;
        REQUIRE(bands.energies(config).isApprox(ArrayXXd::Constant(8, 3, -18.041)));
        REQUIRE(bands.fermi(6.2222, config) == Approx(-5.8188));
    }

    SECTION("Fatbands are skipped unless requested") {
        auto config = BandConfig();
        config.orbitals = {4, 5, 6, 7, 8};
        config.ions = IonSelection::all(2);
        REQUIRE(bands.fat_weights(config).size() == 0);

        config.fatbands = true;
        auto const w = bands.fat_weights(config);
        REQUIRE(w.rows() == 8);
        REQUIRE(w.cols() == 3);
        REQUIRE(w.isApprox(fat_weight(tensor, config.orbitals, config.ions)));
    }

    SECTION("Fatbands without projection data") {
        auto const plain = BandStructure(short_path(), energies);
        REQUIRE_FALSE(plain.has_projections());

        auto config = BandConfig();
        config.fatbands = true;
        config.orbitals = {0};
        config.ions = {0};
        REQUIRE(plain.fat_weights(config).size() == 0);
    }

    SECTION("Selection is validated") {
        auto config = BandConfig();
        config.fatbands = true;
        config.orbitals = {0};
        REQUIRE_THROWS_AS(bands.fat_weights(config), IndexError);
    }
}

TEST_CASE("Band structure dimensions") {
    auto const energies = ArrayXXd::Zero(8, 3).eval();

    REQUIRE_THROWS_WITH(BandStructure(short_path(), ArrayXXd::Zero(7, 3)),
                        "The band energies have 7 k-points, but the path needs "
                        "2 segments x 4 points = 8");
    REQUIRE_THROWS_WITH(BandStructure(short_path(), energies, projections::uniform(9, 2, 8, 4)),
                        "The projections have shape (8, 4) in (k-point, band), "
                        "but the energies have (8, 3)");
    REQUIRE_NOTHROW(BandStructure(short_path(), energies, projections::uniform(1, 1, 8, 3)));
}

TEST_CASE("Density of states") {
    auto const energy = ArrayXd::LinSpaced(4, -1.0, 2.0).eval();
    auto const total = ArrayXd::Constant(4, 10.0).eval();
    auto const dos = DensityOfStates({energy, total, 1.5, projections::per_ion_pdos(3, 9, 4)});

    auto config = DosConfig();
    config.energy_shift = -1.0;

    SECTION("Total") {
        auto const curve = dos.total(config);
        REQUIRE(curve.energy.isApprox(ArrayXd::LinSpaced(4, -2.0, 1.0)));
        REQUIRE(curve.dos.isApprox(total));
        REQUIRE(dos.fermi(config) == Approx(0.5));
    }

    SECTION("Partial DOS is skipped unless requested") {
        config.ion_types = IonTypes::from_counts({2, 1});
        REQUIRE(dos.partial(config).empty());

        config.pdos = true;
        config.type_to_plot = 0;
        config.orbital_to_plot = 8;
        auto const curve = dos.partial(config);
        REQUIRE(curve.energy.isApprox(ArrayXd::LinSpaced(4, -2.0, 1.0)));
        REQUIRE((curve.dos == 3.0).all());

        config.type_to_plot = 1;
        REQUIRE((dos.partial(config).dos == 3.0).all());

        auto const typed = dos.typed(config);
        REQUIRE(typed.size() == 2);
        REQUIRE((typed[0] == 3.0).all());
    }

    SECTION("Partial DOS without per-ion data") {
        auto const plain = DensityOfStates({energy, total, 1.5});
        config.pdos = true;
        config.ion_types = IonTypes::from_counts({2, 1});
        REQUIRE(plain.partial(config).empty());
    }

    SECTION("Mismatched types") {
        config.pdos = true;
        config.ion_types = IonTypes::from_counts({2, 2});
        REQUIRE_THROWS_AS(dos.partial(config), DimensionMismatchError);

        config.ion_types = IonTypes::from_counts({2, 1});
        config.orbital_to_plot = 9;
        REQUIRE_THROWS_AS(dos.partial(config), IndexError);
    }
}
