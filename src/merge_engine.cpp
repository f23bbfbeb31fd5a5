// merge_engine.cpp
// ------------------------------------------------------------------
// MergeEngine: set-union of two containers with weighted conflict
// resolution. Name -> position maps are built once per source; the
// uniqueness invariant guarantees at most one match on each side.
// ------------------------------------------------------------------

#include "merge_engine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>

namespace gbcore {

// ======= Minimal logging helper =======
static inline void log(const std::string& s) {
  std::fprintf(stderr, "[MergeEngine] %s\n", s.c_str());
}

using PosMap = std::unordered_map<std::string, int>;

static PosMap index_names(const std::vector<std::string>& names) {
  PosMap pos;
  pos.reserve(names.size() * 2);
  for (int i = 0; i < (int)names.size(); ++i) pos.emplace(names[i], i);
  return pos;
}

// first's names in order, then second's names not already present
static std::vector<std::string> ordered_union(const std::vector<std::string>& first,
                                              const std::vector<std::string>& second,
                                              const PosMap& first_pos) {
  std::vector<std::string> out = first;
  out.reserve(first.size() + second.size());
  for (const auto& s : second)
    if (first_pos.find(s) == first_pos.end()) out.push_back(s);
  return out;
}

static inline int lookup(const PosMap& pos, const std::string& name) {
  auto it = pos.find(name);
  return it == pos.end() ? -1 : it->second;
}

MergeEngine::MergeEngine(const MergeConfig& cfg) : cfg_(cfg) {
  if (cfg_.conflict_resolution.size() == 2) {
    w1_ = cfg_.conflict_resolution[0];
    w2_ = cfg_.conflict_resolution[1];
  }
}

void MergeEngine::validate_weights_() const {
  const auto& w = cfg_.conflict_resolution;
  if (w.size() != 2 || w[0] < 0.0 || w[1] < 0.0 || std::abs(w[0] + w[1] - 1.0) > 1e-12)
    throw std::invalid_argument(
      "We expect `conflict_resolution` to be 2 non-negative weights which sum up to exactly 1.00.");
}

template <class Axis>
Container<Axis> MergeEngine::run(const Container<Axis>& a, const Container<Axis>& b) const {
  const bool ok_a = checkdims(a), ok_b = checkdims(b);
  if (!ok_a && !ok_b)
    throw std::invalid_argument(std::string("Both ") + Axis::kind + " structs are corrupted.");
  require_valid(a, "first");
  require_valid(b, "second");
  validate_weights_();

  const PosMap ent_a = index_names(a.entries), ent_b = index_names(b.entries);
  const PosMap fea_a = index_names(a.features), fea_b = index_names(b.features);

  const auto entries  = ordered_union(a.entries, b.entries, ent_a);
  const auto features = ordered_union(a.features, b.features, fea_a);
  const int n = (int)entries.size();
  const int p = (int)features.size();

  if (cfg_.verbose)
    log("Merging 2 " + std::string(Axis::kind) + " structs: " + std::to_string(a.n) + "x" +
        std::to_string(a.p) + " + " + std::to_string(b.n) + "x" + std::to_string(b.p) +
        " -> " + std::to_string(n) + "x" + std::to_string(p));

  Container<Axis> out(n, p);
  out.entries = entries;
  out.features = features;
  std::fill(out.mask.begin(), out.mask.end(), 0);

  // feature positions in each source, resolved once
  std::vector<int> ja(p), jb(p);
  for (int j = 0; j < p; ++j) {
    ja[j] = lookup(fea_a, features[j]);
    jb[j] = lookup(fea_b, features[j]);
  }

  size_t n_conflicts = 0, n_pop_conflicts = 0;
  for (int i = 0; i < n; ++i) {
    const int ia = lookup(ent_a, entries[i]);
    const int ib = lookup(ent_b, entries[i]);

    if (ia >= 0 && ib >= 0) {
      const std::string& pa = a.populations[ia];
      const std::string& pb = b.populations[ib];
      if (pa == pb) {
        out.populations[i] = pa;
      } else {
        out.populations[i] = "CONFLICT (" + pa + ", " + pb + ")";
        ++n_pop_conflicts;
      }
    } else if (ia >= 0) {
      out.populations[i] = a.populations[ia];
    } else {
      out.populations[i] = b.populations[ib];
    }

    for (int j = 0; j < p; ++j) {
      const bool in_a = ia >= 0 && ja[j] >= 0;
      const bool in_b = ib >= 0 && jb[j] >= 0;
      if (in_a && in_b) {
        const Cell& qa = a.value(ia, ja[j]);
        const Cell& qb = b.value(ib, jb[j]);
        const bool ma = a.usable(ia, ja[j]);
        const bool mb = b.usable(ib, jb[j]);
        const bool equal = same_cell(qa, qb);
        if (equal) {
          out.value(i, j) = qa;
          out.set_usable(i, j, ma);
          continue;
        }
        ++n_conflicts;
        if (qa && qb)  out.value(i, j) = w1_ * (*qa) + w2_ * (*qb);
        else if (qa)   out.value(i, j) = qa;
        else           out.value(i, j) = qb;
        // nearbyint: ties to even under the default rounding mode
        const double vote = w1_ * (ma ? 1.0 : 0.0) + w2_ * (mb ? 1.0 : 0.0);
        out.set_usable(i, j, std::nearbyint(vote) != 0.0);
      } else if (in_a) {
        out.value(i, j) = a.value(ia, ja[j]);
        out.set_usable(i, j, a.usable(ia, ja[j]));
      } else if (in_b) {
        out.value(i, j) = b.value(ib, jb[j]);
        out.set_usable(i, j, b.usable(ib, jb[j]));
      }
    }
  }

  if (cfg_.verbose)
    log("resolved " + std::to_string(n_conflicts) + " conflicting cells, " +
        std::to_string(n_pop_conflicts) + " population conflicts");

  if (!checkdims(out))
    throw InternalError(std::string("Error merging the 2 ") + Axis::kind + " structs.");
  return out;
}

template <class Axis>
Container<Axis> merge(const Container<Axis>& a, const Container<Axis>& b,
                      const std::vector<double>& conflict_resolution) {
  MergeConfig cfg;
  cfg.conflict_resolution = conflict_resolution;
  return MergeEngine(cfg).run(a, b);
}

template Genomes  MergeEngine::run<GenomicAxis>(const Genomes&, const Genomes&) const;
template Phenomes MergeEngine::run<PhenomicAxis>(const Phenomes&, const Phenomes&) const;
template Genomes  merge<GenomicAxis>(const Genomes&, const Genomes&, const std::vector<double>&);
template Phenomes merge<PhenomicAxis>(const Phenomes&, const Phenomes&, const std::vector<double>&);

} // namespace gbcore
