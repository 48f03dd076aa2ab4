#include "projection/Orbitals.hpp"

#include "support/errors.hpp"
#include "support/format.hpp"

#include <algorithm>
#include <iterator>

namespace cfb { namespace orbitals {

namespace {
    struct Shell {
        char const* name;
        idx_t first;
        idx_t last;
    };

    // lm-decomposed shells: contiguous m-channel ranges [first, last)
    constexpr Shell lm_shells[] = {{"s", 0, 1}, {"p", 1, 4}, {"d", 4, 9}};
} // anonymous namespace

std::vector<std::string> const& names(Decomposition decomposition) {
    static auto const l_names = std::vector<std::string>{"s", "p", "d"};
    static auto const lm_names = std::vector<std::string>{
        "s", "py", "pz", "px", "dxy", "dyz", "dz2", "dxz", "dx2-y2"
    };
    return decomposition == Decomposition::l ? l_names : lm_names;
}

idx_t size(Decomposition decomposition) {
    return static_cast<idx_t>(names(decomposition).size());
}

OrbitalSelection select(Decomposition decomposition, std::vector<std::string> const& requested) {
    auto const& channels = names(decomposition);

    auto indices = std::vector<idx_t>();
    for (auto const& name : requested) {
        auto const it = std::find(channels.begin(), channels.end(), name);
        if (it != channels.end()) {
            indices.push_back(static_cast<idx_t>(it - channels.begin()));
            continue;
        }

        if (decomposition == Decomposition::lm) {
            auto const shell = std::find_if(std::begin(lm_shells), std::end(lm_shells),
                                            [&](Shell const& s) { return name == s.name; });
            if (shell != std::end(lm_shells)) {
                for (auto i = shell->first; i < shell->last; ++i) {
                    indices.push_back(i);
                }
                continue;
            }
        }

        throw IndexError(fmt::format("Unknown orbital '{}', expected one of [{}]",
                                     name, fmt::quoted_list(channels)));
    }
    return OrbitalSelection(std::move(indices));
}

}} // namespace cfb::orbitals
