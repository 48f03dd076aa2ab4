#pragma once
#include "projection/Selection.hpp"

#include <string>
#include <vector>

namespace cfb { namespace orbitals {

/// Orbital channels of the projection data, in the order they are stored
enum class Decomposition {
    l,  ///< one channel per angular momentum: s, p, d
    lm  ///< one channel per (l, m) pair: s, py, pz, px, dxy, dyz, dz2, dxz, dx2-y2
};

/// Channel names of a decomposition, the position in the list is the orbital index
std::vector<std::string> const& names(Decomposition decomposition);

/// Number of orbital channels
idx_t size(Decomposition decomposition);

/**
 Resolve orbital names into a selection

 Accepts the channel names of the decomposition. For `Decomposition::lm`, the shell
 names "p" and "d" are also accepted and expand to all of their m-channels.
 Throws `IndexError` for an unknown name.
 */
OrbitalSelection select(Decomposition decomposition, std::vector<std::string> const& names);

}} // namespace cfb::orbitals
