// container.cpp
// ------------------------------------------------------------------
// Structural invariant, deep copy, equality, phenomic summary and the
// tabular view shared by Genomes and Phenomes.
// ------------------------------------------------------------------

#include "gbcore.hpp"

#include <cmath>
#include <unordered_set>

namespace gbcore {

static inline bool all_unique(const std::vector<std::string>& names) {
  std::unordered_set<std::string> seen;
  seen.reserve(names.size() * 2);
  for (const auto& s : names)
    if (!seen.insert(s).second) return false;
  return true;
}

template <class Axis>
bool checkdims(const Container<Axis>& c) {
  if (c.n < 0 || c.p < 0) return false;
  const size_t n = static_cast<size_t>(c.n);
  const size_t p = static_cast<size_t>(c.p);
  if (c.entries.size() != n || !all_unique(c.entries)) return false;
  if (c.populations.size() != n) return false;
  if (c.features.size() != p || !all_unique(c.features)) return false;
  if (c.values.size() != n * p || c.mask.size() != n * p) return false;
  return true;
}

template <class Axis>
Container<Axis> clone(const Container<Axis>& c) {
  Container<Axis> out;
  out.n = c.n;
  out.p = c.p;
  out.entries = c.entries;
  out.populations = c.populations;
  out.features = c.features;
  out.values = c.values;
  out.mask = c.mask;
  return out;
}

template <class Axis>
bool operator==(const Container<Axis>& a, const Container<Axis>& b) {
  if (a.n != b.n || a.p != b.p) return false;
  if (a.entries != b.entries || a.populations != b.populations || a.features != b.features) return false;
  if (a.mask != b.mask) return false;
  if (a.values.size() != b.values.size()) return false;
  for (size_t k = 0; k < a.values.size(); ++k)
    if (!same_cell(a.values[k], b.values[k])) return false;
  return true;
}

template <class Axis>
Table tabularise(const Container<Axis>& c) {
  require_valid(c);
  Table t;
  t.header = {"id", "entries", "populations"};
  t.header.insert(t.header.end(), c.features.begin(), c.features.end());
  t.id.resize(c.n);
  for (int i = 0; i < c.n; ++i) t.id[i] = i + 1;
  t.entries = c.entries;
  t.populations = c.populations;
  t.columns.assign(c.p, std::vector<Cell>(c.n));
  for (int i = 0; i < c.n; ++i)
    for (int j = 0; j < c.p; ++j)
      t.columns[j][i] = c.value(i, j);
  return t;
}

int Table::feature_column(const std::string& name) const {
  // header = id, entries, populations, features...
  for (size_t k = 3; k < header.size(); ++k)
    if (header[k] == name) return static_cast<int>(k - 3);
  return -1;
}

std::map<std::string, long long> dimensions(const Phenomes& phenomes) {
  require_valid(phenomes);
  long long n_zeroes = 0, n_missing = 0, n_nan = 0, n_inf = 0;
  for (const auto& v : phenomes.values) {
    if (!v) { ++n_missing; continue; }
    if (*v == 0.0) ++n_zeroes;
    if (std::isnan(*v)) ++n_nan;
    if (std::isinf(*v)) ++n_inf;
  }
  std::unordered_set<std::string> pops(phenomes.populations.begin(), phenomes.populations.end());
  std::unordered_set<std::string> ents(phenomes.entries.begin(), phenomes.entries.end());
  return {
    {"n_entries",     static_cast<long long>(ents.size())},
    {"n_populations", static_cast<long long>(pops.size())},
    {"n_traits",      static_cast<long long>(phenomes.p)},
    {"n_total",       static_cast<long long>(phenomes.n) * phenomes.p},
    {"n_zeroes",      n_zeroes},
    {"n_missing",     n_missing},
    {"n_nan",         n_nan},
    {"n_inf",         n_inf},
  };
}

template bool checkdims<GenomicAxis>(const Genomes&);
template bool checkdims<PhenomicAxis>(const Phenomes&);
template Genomes  clone<GenomicAxis>(const Genomes&);
template Phenomes clone<PhenomicAxis>(const Phenomes&);
template bool operator==<GenomicAxis>(const Genomes&, const Genomes&);
template bool operator==<PhenomicAxis>(const Phenomes&, const Phenomes&);
template Table tabularise<GenomicAxis>(const Genomes&);
template Table tabularise<PhenomicAxis>(const Phenomes&);

} // namespace gbcore
