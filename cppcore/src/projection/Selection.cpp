#include "projection/Selection.hpp"

#include "detail/algorithm.hpp"
#include "support/errors.hpp"
#include "support/format.hpp"

#include <numeric>

namespace cfb {

template<class Tag>
IndexSelection<Tag>::IndexSelection(std::initializer_list<idx_t> indices)
    : IndexSelection(std::vector<idx_t>(indices)) {}

template<class Tag>
IndexSelection<Tag>::IndexSelection(std::vector<idx_t> indices)
    : data(sorted_unique(std::move(indices))) {}

template<class Tag>
IndexSelection<Tag> IndexSelection<Tag>::range(idx_t first, idx_t last) {
    if (last < first) {
        throw IndexError(fmt::format("Invalid {} range [{}, {})", Tag::name(), first, last));
    }

    auto indices = std::vector<idx_t>(static_cast<std::size_t>(last - first));
    std::iota(indices.begin(), indices.end(), first);
    return IndexSelection(std::move(indices));
}

template<class Tag>
void IndexSelection<Tag>::validate(idx_t bound) const {
    if (data.empty()) {
        throw IndexError(fmt::format("The {} selection can't be empty", Tag::name()));
    }

    auto const it = find_out_of_range(data.begin(), data.end(), bound);
    if (it != data.end()) {
        throw IndexError(fmt::format("The {} index {} is out of range [0, {})",
                                     Tag::name(), *it, bound));
    }
}

template class IndexSelection<detail::OrbitalTag>;
template class IndexSelection<detail::IonTag>;

IonTypes IonTypes::from_counts(std::vector<idx_t> const& counts,
                               std::vector<std::string> const& names) {
    if (!names.empty() && names.size() != counts.size()) {
        throw DimensionMismatchError(fmt::format("Got {} ion type names for {} ion counts",
                                                 names.size(), counts.size()));
    }

    auto result = IonTypes();
    for (auto n = std::size_t{0}; n < counts.size(); ++n) {
        auto const name = names.empty() ? fmt::format("type{}", n) : names[n];
        result.add_type(name, counts[n]);
    }
    return result;
}

void IonTypes::add_type(std::string const& name, idx_t count) {
    check_unique_name(name);
    if (count < 0) {
        throw DimensionMismatchError(fmt::format("Ion type '{}' can't have a negative count ({})",
                                                 name, count));
    }
    types.push_back({name, count, {}});
}

void IonTypes::add_type(std::string const& name, std::vector<idx_t> ions) {
    check_unique_name(name);
    if (ions.empty()) {
        throw IndexError(fmt::format("Ion type '{}' must list at least one ion", name));
    }

    auto const unique = sorted_unique(ions);
    if (unique.size() != ions.size()) {
        throw DimensionMismatchError(fmt::format("Ion type '{}' lists the same ion twice", name));
    }

    auto const count = static_cast<idx_t>(unique.size());
    types.push_back({name, count, unique});
}

idx_t IonTypes::num_ions() const {
    return std::accumulate(types.begin(), types.end(), idx_t{0},
                           [](idx_t total, Type const& t) { return total + t.count; });
}

std::vector<idx_t> IonTypes::counts() const {
    auto result = std::vector<idx_t>();
    result.reserve(types.size());
    for (auto const& t : types) {
        result.push_back(t.count);
    }
    return result;
}

idx_t IonTypes::find(std::string const& name) const {
    auto const it = std::find_if(types.begin(), types.end(),
                                 [&](Type const& t) { return t.name == name; });
    if (it == types.end()) {
        throw IndexError(fmt::format("There is no ion type named '{}'", name));
    }
    return static_cast<idx_t>(it - types.begin());
}

void IonTypes::check_unique_name(std::string const& name) const {
    if (name.empty()) { throw std::logic_error("Ion type name can't be blank"); }

    auto const exists = std::any_of(types.begin(), types.end(),
                                    [&](Type const& t) { return t.name == name; });
    if (exists) { throw std::logic_error(fmt::format("Ion type '{}' already exists", name)); }
}

} // namespace cfb
