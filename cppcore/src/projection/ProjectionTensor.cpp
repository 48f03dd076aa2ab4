#include "projection/ProjectionTensor.hpp"

#include "support/errors.hpp"
#include "support/format.hpp"

#include <algorithm>
#include <functional>
#include <numeric>

namespace cfb {

namespace {
    idx_t shape_size(ProjectionTensor::Shape const& shape) {
        if (std::any_of(shape.begin(), shape.end(), [](idx_t n) { return n < 0; })) {
            throw DimensionMismatchError(fmt::format(
                "ProjectionTensor: negative dimension in shape ({}, {}, {}, {})",
                shape[0], shape[1], shape[2], shape[3]
            ));
        }
        return std::accumulate(shape.begin(), shape.end(), idx_t{1}, std::multiplies<idx_t>());
    }
} // anonymous namespace

ProjectionTensor::ProjectionTensor(Shape shape)
    : dims(shape), data(ArrayXd::Zero(shape_size(shape))) {}

ProjectionTensor::ProjectionTensor(Shape shape, ArrayXd data_)
    : dims(shape), data(std::move(data_)) {
    auto const expected = shape_size(shape);
    if (data.size() != expected) {
        throw DimensionMismatchError(fmt::format(
            "ProjectionTensor: shape ({}, {}, {}, {}) needs {} values, got {}",
            shape[0], shape[1], shape[2], shape[3], expected, data.size()
        ));
    }
}

} // namespace cfb
