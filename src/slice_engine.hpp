#pragma once
#include "gbcore.hpp"
#include <optional>
#include <vector>

namespace gbcore {

using IndexList = std::optional<std::vector<int>>;

// Row/column projection into a new, independent container.
//  - indices are 1-based positions into the current ordering; nullopt = all
//  - indices are sorted and deduplicated, so output order follows `c`
//  - an index outside [1, n] / [1, p] is std::invalid_argument
template <class Axis>
Container<Axis> slice(const Container<Axis>& c,
                      const IndexList& idx_entries = std::nullopt,
                      const IndexList& idx_features = std::nullopt);

// Keeps entries and features whose whole mask row/column is usable.
// Decided on the full mask before either axis is reduced.
template <class Axis>
Container<Axis> filter(const Container<Axis>& c);

} // namespace gbcore
