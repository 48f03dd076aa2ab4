#pragma once
#include "numeric/dense.hpp"

#include <array>

namespace cfb {

/**
 Orbital-projected band weights indexed by (orbital, ion, k-point, band)

 The weights come from an external PROCAR decoder. They are non-negative and, for a
 fixed (k-point, band), add up to approximately 1 over all orbitals and ions.
 The data is stored in a single row-major buffer so that every (orbital, ion)
 pair owns a contiguous (k-point, band) slab.
 */
class ProjectionTensor {
public:
    using Shape = std::array<idx_t, 4>;

public:
    ProjectionTensor() : dims{{0, 0, 0, 0}} {}
    /// Zero-initialized tensor
    explicit ProjectionTensor(Shape shape);
    /// Take ownership of row-major `data` -- its size must match the `shape`
    ProjectionTensor(Shape shape, ArrayXd data);

    Shape const& shape() const { return dims; }
    idx_t num_orbitals() const { return dims[0]; }
    idx_t num_ions() const { return dims[1]; }
    idx_t num_kpoints() const { return dims[2]; }
    idx_t num_bands() const { return dims[3]; }

    idx_t size() const { return data.size(); }
    bool empty() const { return data.size() == 0; }

    double operator()(idx_t orbital, idx_t ion, idx_t kpoint, idx_t band) const {
        return data[offset(orbital, ion) + kpoint * dims[3] + band];
    }
    double& operator()(idx_t orbital, idx_t ion, idx_t kpoint, idx_t band) {
        return data[offset(orbital, ion) + kpoint * dims[3] + band];
    }

    /// The (k-point, band) weights of a single orbital on a single ion
    ArrayXXdConstMap slab(idx_t orbital, idx_t ion) const {
        return {data.data() + offset(orbital, ion), dims[2], dims[3]};
    }

    /// The underlying row-major buffer
    ArrayXd const& flat() const { return data; }

private:
    idx_t offset(idx_t orbital, idx_t ion) const {
        return (orbital * dims[1] + ion) * dims[2] * dims[3];
    }

private:
    Shape dims;
    ArrayXd data;
};

} // namespace cfb
