// slice_engine.cpp
// ------------------------------------------------------------------
// Index-based slicing and mask-driven filtering. Both always allocate
// a fresh container and re-check the invariant on the way out.
// ------------------------------------------------------------------

#include "slice_engine.hpp"

#include <algorithm>
#include <string>

namespace gbcore {

// 1-based request -> sorted unique 0-based positions.
static std::vector<size_t> resolve_indices(const IndexList& idx, int upper, const char* what,
                                           const char* kind) {
  std::vector<size_t> out;
  if (!idx.has_value()) {
    out.resize(upper);
    for (int k = 0; k < upper; ++k) out[k] = static_cast<size_t>(k);
    return out;
  }
  for (int i : *idx) {
    if (i < 1 || i > upper)
      throw std::invalid_argument(std::string("We accept `") + what + "` from 1 to " +
                                  std::to_string(upper) + " of the " + kind +
                                  " struct; got " + std::to_string(i) + ".");
  }
  std::vector<int> sorted = *idx;
  std::sort(sorted.begin(), sorted.end());
  sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
  out.reserve(sorted.size());
  for (int i : sorted) out.push_back(static_cast<size_t>(i - 1));
  return out;
}

template <class Axis>
Container<Axis> slice(const Container<Axis>& c,
                      const IndexList& idx_entries,
                      const IndexList& idx_features) {
  require_valid(c);
  const auto rows = resolve_indices(idx_entries, c.n, "idx_entries", Axis::kind);
  const auto cols = resolve_indices(idx_features, c.p, "idx_features", Axis::kind);

  Container<Axis> out(static_cast<int>(rows.size()), static_cast<int>(cols.size()));
  for (size_t j = 0; j < cols.size(); ++j) out.features[j] = c.features[cols[j]];
  for (size_t i = 0; i < rows.size(); ++i) {
    const size_t r = rows[i];
    out.entries[i] = c.entries[r];
    out.populations[i] = c.populations[r];
    for (size_t j = 0; j < cols.size(); ++j) {
      out.value(i, j) = c.value(r, cols[j]);
      out.set_usable(i, j, c.usable(r, cols[j]));
    }
  }

  if (!checkdims(out))
    throw InternalError(std::string("Error slicing the ") + Axis::kind + " struct.");
  return out;
}

template <class Axis>
Container<Axis> filter(const Container<Axis>& c) {
  require_valid(c);
  // Mean of the mask row/column must be exactly 1; an empty row/column has no mean.
  std::vector<int> keep_rows, keep_cols;
  for (int i = 0; i < c.n; ++i) {
    bool all = c.p > 0;
    for (int j = 0; j < c.p && all; ++j) all = c.usable(i, j);
    if (all) keep_rows.push_back(i + 1);
  }
  for (int j = 0; j < c.p; ++j) {
    bool all = c.n > 0;
    for (int i = 0; i < c.n && all; ++i) all = c.usable(i, j);
    if (all) keep_cols.push_back(j + 1);
  }
  return slice(c, keep_rows, keep_cols);
}

template Genomes  slice<GenomicAxis>(const Genomes&, const IndexList&, const IndexList&);
template Phenomes slice<PhenomicAxis>(const Phenomes&, const IndexList&, const IndexList&);
template Genomes  filter<GenomicAxis>(const Genomes&);
template Phenomes filter<PhenomicAxis>(const Phenomes&);

} // namespace gbcore
