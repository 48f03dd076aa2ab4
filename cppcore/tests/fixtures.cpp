#include "fixtures.hpp"

#include <random>
#include <sstream>
using namespace cfb;

namespace kpoints {

std::string gamma_x_m() {
    return "k-points along high symmetry lines\n"
           " 40   ! intersections\n"
           "Line-mode\n"
           "rec\n"
           "  0.0 0.0 0.0   1 GAMMA\n"
           "  0.5 0.0 0.0   1 X\n"
           "\n"
           "  0.5 0.0 0.0   1 X\n"
           "  0.5 0.5 0.0   1 M\n";
}

std::vector<std::string> lines(std::string const& text) {
    auto stream = std::istringstream(text);
    auto result = std::vector<std::string>();
    for (auto line = std::string(); std::getline(stream, line);) {
        result.push_back(line);
    }
    return result;
}

} // namespace kpoints

namespace projections {

ProjectionTensor uniform(idx_t norb, idx_t nion, idx_t nkpt, idx_t nband) {
    auto const size = norb * nion * nkpt * nband;
    auto const shape = ProjectionTensor::Shape{{norb, nion, nkpt, nband}};
    return {shape, ArrayXd::Constant(size, 1.0 / static_cast<double>(norb * nion))};
}

ProjectionTensor random_complete(idx_t norb, idx_t nion, idx_t nkpt, idx_t nband) {
    auto tensor = ProjectionTensor(ProjectionTensor::Shape{{norb, nion, nkpt, nband}});

    auto generator = std::mt19937(42);
    auto distribution = std::uniform_real_distribution<double>(0.0, 1.0);
    for (auto o = idx_t{0}; o < norb; ++o) {
        for (auto i = idx_t{0}; i < nion; ++i) {
            for (auto k = idx_t{0}; k < nkpt; ++k) {
                for (auto b = idx_t{0}; b < nband; ++b) {
                    tensor(o, i, k, b) = distribution(generator);
                }
            }
        }
    }

    for (auto k = idx_t{0}; k < nkpt; ++k) {
        for (auto b = idx_t{0}; b < nband; ++b) {
            auto total = 0.0;
            for (auto o = idx_t{0}; o < norb; ++o) {
                for (auto i = idx_t{0}; i < nion; ++i) {
                    total += tensor(o, i, k, b);
                }
            }
            for (auto o = idx_t{0}; o < norb; ++o) {
                for (auto i = idx_t{0}; i < nion; ++i) {
                    tensor(o, i, k, b) /= total;
                }
            }
        }
    }
    return tensor;
}

std::vector<ArrayXXd> per_ion_pdos(idx_t nion, idx_t norb, idx_t nbins) {
    auto result = std::vector<ArrayXXd>();
    for (auto n = idx_t{0}; n < nion; ++n) {
        result.push_back(ArrayXXd::Constant(norb, nbins, static_cast<double>(n + 1)));
    }
    return result;
}

} // namespace projections
