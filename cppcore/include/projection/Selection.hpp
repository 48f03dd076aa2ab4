#pragma once
#include "detail/config.hpp"

#include <initializer_list>
#include <string>
#include <vector>

namespace cfb {

namespace detail {
    struct OrbitalTag { static char const* name() { return "orbital"; } };
    struct IonTag { static char const* name() { return "ion"; } };
}

/**
 Set of 0-based indices along one axis of the projection data

 Repeated indices are removed and the rest are kept in ascending order, so a
 selection never counts the same orbital or ion twice. The `Tag` keeps orbital
 and ion selections from being swapped by accident.
 */
template<class Tag>
class IndexSelection {
public:
    IndexSelection() = default;
    IndexSelection(std::initializer_list<idx_t> indices);
    explicit IndexSelection(std::vector<idx_t> indices);

    /// Contiguous indices in `[first, last)`
    static IndexSelection range(idx_t first, idx_t last);
    /// Everything in `[0, size)`
    static IndexSelection all(idx_t size) { return range(0, size); }

    std::vector<idx_t> const& indices() const { return data; }
    idx_t size() const { return static_cast<idx_t>(data.size()); }
    bool empty() const { return data.empty(); }

    std::vector<idx_t>::const_iterator begin() const { return data.begin(); }
    std::vector<idx_t>::const_iterator end() const { return data.end(); }

    /// Throw `IndexError` if the selection is empty or reaches outside of `[0, bound)`
    void validate(idx_t bound) const;

    friend bool operator==(IndexSelection const& a, IndexSelection const& b) {
        return a.data == b.data;
    }
    friend bool operator!=(IndexSelection const& a, IndexSelection const& b) { return !(a == b); }

private:
    std::vector<idx_t> data;
};

using OrbitalSelection = IndexSelection<detail::OrbitalTag>;
using IonSelection = IndexSelection<detail::IonTag>;

extern template class IndexSelection<detail::OrbitalTag>;
extern template class IndexSelection<detail::IonTag>;

/**
 Named groups of ions, e.g. the species of a POSCAR: {"Y", 6}, {"Al", 2}

 A type declared with only a count takes the next `count` ions in structure order,
 so the caller must list the types in the same order as the ions appear in the
 per-ion data. A type declared with explicit ion indices doesn't depend on the
 order and can be checked against the other types.
 */
class IonTypes {
public:
    struct Type {
        std::string name;
        idx_t count; ///< number of ions of this type
        std::vector<idx_t> ions; ///< explicit 0-based ion indices, empty if only `count` is known

        bool is_explicit() const { return !ions.empty(); }
    };

public:
    IonTypes() = default;

    /// Build count-only types, `names` may be empty (the types are then named by index)
    static IonTypes from_counts(std::vector<idx_t> const& counts,
                                std::vector<std::string> const& names = {});

    /// Add a type which takes the next `count` ions in order
    void add_type(std::string const& name, idx_t count);
    /// Add a type with explicit ion indices
    void add_type(std::string const& name, std::vector<idx_t> ions);

    std::vector<Type> const& get_types() const { return types; }
    Type const& operator[](idx_t n) const { return types[static_cast<std::size_t>(n)]; }

    /// Number of types
    idx_t size() const { return static_cast<idx_t>(types.size()); }
    bool empty() const { return types.empty(); }
    /// Total number of ions over all types
    idx_t num_ions() const;
    /// Per-type ion counts in declaration order
    std::vector<idx_t> counts() const;
    /// Index of the type with the given name -- throws `IndexError` if there is no such type
    idx_t find(std::string const& name) const;

private:
    void check_unique_name(std::string const& name) const;

private:
    std::vector<Type> types;
};

} // namespace cfb
