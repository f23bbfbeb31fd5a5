#pragma once
#include <cmath>
#include <cstddef>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace gbcore {

// -------- Error taxonomy --------
// Caller-fixable problems (corrupted inputs, bad indices, bad options) are
// reported with std::invalid_argument. The two types below cover the rest.

// Invariant violated by one of our own transformations; never caller-fixable.
struct InternalError : std::logic_error {
  using std::logic_error::logic_error;
};

// No pairwise matrix could be computed (<= 1 entry and <= 1 feature).
struct DataTooSparse : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// -------- Axis tags --------

struct GenomicAxis {
  static constexpr const char* kind          = "Genomes";
  static constexpr const char* feature_label = "loci_alleles";
  static constexpr const char* value_label   = "allele_frequencies";
  static constexpr char        delimiter     = ',';   // loci-allele names carry tabs
};

struct PhenomicAxis {
  static constexpr const char* kind          = "Phenomes";
  static constexpr const char* feature_label = "traits";
  static constexpr const char* value_label   = "phenotypes";
  static constexpr char        delimiter     = '\t';
};

// -------- Core data structure --------

using Cell = std::optional<double>;

// Entry x feature matrix with names, populations and a usability mask.
// values/mask are stored row-major (n*p), entry i / feature j at i*p + j.
template <class Axis>
struct Container {
  using axis_type = Axis;

  int n{0};
  int p{0};

  std::vector<std::string> entries;      // length n, unique
  std::vector<std::string> populations;  // length n
  std::vector<std::string> features;     // length p, unique
  std::vector<Cell> values;              // n*p, nullopt = missing
  std::vector<unsigned char> mask;       // n*p, 1 = usable

  Container() = default;

  // Empty container: blank names, all missing, all usable.
  Container(int n_, int p_) : n(n_), p(p_) {
    if (n_ < 0 || p_ < 0)
      throw std::invalid_argument(std::string(Axis::kind) + " dimensions must be non-negative");
    entries.assign(n_, "");
    populations.assign(n_, "");
    features.assign(p_, "");
    values.assign(static_cast<size_t>(n_) * static_cast<size_t>(p_), std::nullopt);
    mask.assign(static_cast<size_t>(n_) * static_cast<size_t>(p_), 1);
  }

  Cell&       value(size_t i, size_t j)       { return values[i * static_cast<size_t>(p) + j]; }
  const Cell& value(size_t i, size_t j) const { return values[i * static_cast<size_t>(p) + j]; }

  bool usable(size_t i, size_t j) const { return mask[i * static_cast<size_t>(p) + j] != 0; }
  void set_usable(size_t i, size_t j, bool b) { mask[i * static_cast<size_t>(p) + j] = b ? 1 : 0; }
};

using Genomes  = Container<GenomicAxis>;
using Phenomes = Container<PhenomicAxis>;

// Thin named accessors over the shared feature axis.
inline std::vector<std::string>&       loci_allele_names(Genomes& g)        { return g.features; }
inline const std::vector<std::string>& loci_allele_names(const Genomes& g)  { return g.features; }
inline std::vector<std::string>&       traits(Phenomes& y)                  { return y.features; }
inline const std::vector<std::string>& traits(const Phenomes& y)            { return y.features; }

// Present, not NaN, not +/-Inf.
inline bool is_usable_number(const Cell& c) { return c.has_value() && std::isfinite(*c); }

// Missing equals missing, NaN equals NaN: compares the ternary state, not IEEE.
inline bool same_cell(const Cell& a, const Cell& b) {
  if (a.has_value() != b.has_value()) return false;
  if (!a.has_value()) return true;
  if (std::isnan(*a) || std::isnan(*b)) return std::isnan(*a) && std::isnan(*b);
  return *a == *b;
}

// One row per entry: id (1-based), entry, population, then one column per feature.
struct Table {
  std::vector<std::string> header;              // "id", "entries", "populations", features...
  std::vector<int> id;
  std::vector<std::string> entries;
  std::vector<std::string> populations;
  std::vector<std::vector<Cell>> columns;       // columns[j][i] = feature j of row i

  size_t n_rows() const { return entries.size(); }
  // Index into `columns`, or -1 if `name` is not a feature column.
  int feature_column(const std::string& name) const;
};

// -------- Container operations (container.cpp) --------

template <class Axis> bool checkdims(const Container<Axis>& c);
template <class Axis> Container<Axis> clone(const Container<Axis>& c);
template <class Axis> bool operator==(const Container<Axis>& a, const Container<Axis>& b);
template <class Axis> bool operator!=(const Container<Axis>& a, const Container<Axis>& b) { return !(a == b); }
template <class Axis> Table tabularise(const Container<Axis>& c);

std::map<std::string, long long> dimensions(const Phenomes& phenomes);
std::map<std::string, long long> dimensions(const Genomes& genomes);   // genomes.cpp

// Throws std::invalid_argument when `c` fails checkdims.
template <class Axis>
inline void require_valid(const Container<Axis>& c, const char* which = nullptr) {
  if (checkdims(c)) return;
  std::string msg = which ? std::string("The ") + which + " " + Axis::kind + " struct is corrupted."
                          : std::string(Axis::kind) + " struct is corrupted.";
  throw std::invalid_argument(msg);
}

} // namespace gbcore
