// distance_engine.cpp
// ------------------------------------------------------------------
// DistanceEngine: pairwise euclidean / correlation / mad / rmsd /
// chi-square statistics across features and across entries, using
// only positions where both vectors are finite.
//
// Depends: Armadillo (matrices, per-pair statistics),
//          Eigen3 (column standardisation over a mapped column).
// ------------------------------------------------------------------

#include "distance_engine.hpp"

#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

namespace gbcore {

// ======= Minimal logging helper =======
static inline void log(const std::string& s) {
  std::fprintf(stderr, "[DistanceEngine] %s\n", s.c_str());
}

static constexpr double kMinVariance = 1e-7;

DistanceEngine::DistanceEngine(const DistanceConfig& cfg) : cfg_(cfg) {}

const std::vector<std::string>& DistanceEngine::recognised_metrics() {
  static const std::vector<std::string> names{"euclidean", "correlation", "mad", "rmsd", "chi_square"};
  return names;
}

const char* DistanceEngine::metric_name_(Metric m) {
  switch (m) {
    case Metric::euclidean:   return "euclidean";
    case Metric::correlation: return "correlation";
    case Metric::mad:         return "mad";
    case Metric::rmsd:        return "rmsd";
    case Metric::chi_square:  return "chi_square";
  }
  throw InternalError("unhandled distance metric");
}

std::vector<DistanceEngine::Metric> DistanceEngine::resolve_metrics_() const {
  const auto& known = recognised_metrics();
  auto choices = [&]() {
    std::ostringstream oss;
    for (const auto& k : known) oss << "\n\t- " << k;
    return oss.str();
  };

  std::vector<std::string> uniq;
  for (const auto& m : cfg_.metrics)
    if (std::find(uniq.begin(), uniq.end(), m) == uniq.end()) uniq.push_back(m);
  if (uniq.empty())
    throw std::invalid_argument("Please supply at least 1 distance metric. Choose from:" + choices());

  std::vector<std::string> bad;
  std::vector<Metric> out;
  for (const auto& m : uniq) {
    auto it = std::find(known.begin(), known.end(), m);
    if (it == known.end()) { bad.push_back(m); continue; }
    out.push_back(static_cast<Metric>(it - known.begin()));
  }
  if (!bad.empty()) {
    std::ostringstream oss;
    oss << "Unrecognised metric/s:";
    for (const auto& b : bad) oss << "\n\t- " << b;
    oss << "\nPlease choose from:" << choices();
    throw std::invalid_argument(oss.str());
  }
  return out;
}

// Missing cells become NaN: from here on only finiteness matters.
arma::mat DistanceEngine::dense_(const std::vector<Cell>& values, int n, int p) {
  arma::mat X(n, p);
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < p; ++j) {
      const Cell& v = values[(size_t)i * (size_t)p + (size_t)j];
      X(i, j) = v ? *v : arma::datum::nan;
    }
  return X;
}

void DistanceEngine::standardise_columns_(arma::mat& X) {
  const Eigen::Index n = static_cast<Eigen::Index>(X.n_rows);
  for (arma::uword j = 0; j < X.n_cols; ++j) {
    Eigen::Map<Eigen::VectorXd> col(X.colptr(j), n);
    std::vector<Eigen::Index> idx;
    for (Eigen::Index i = 0; i < n; ++i)
      if (std::isfinite(col[i])) idx.push_back(i);
    if (idx.empty()) continue;

    Eigen::VectorXd y(static_cast<Eigen::Index>(idx.size()));
    for (size_t k = 0; k < idx.size(); ++k) y[k] = col[idx[k]];
    const double mean = y.mean();
    // sample sd; a single value gives NaN, as does zero spread
    const double sd = std::sqrt((y.array() - mean).square().sum() / static_cast<double>(y.size() - 1));
    for (size_t k = 0; k < idx.size(); ++k) col[idx[k]] = (y[k] - mean) / sd;
  }
}

void DistanceEngine::axis_pass_(const arma::mat& V, const std::string& axis,
                                const std::vector<Metric>& metrics,
                                DistanceResult& out) const {
  const arma::uword m = V.n_cols;
  const double ninf = -std::numeric_limits<double>::infinity();
  const double eps = std::numeric_limits<double>::epsilon();

  std::vector<arma::mat> D(metrics.size());
  for (auto& M : D) { M.set_size(m, m); M.fill(ninf); }
  arma::mat counts(m, m, arma::fill::zeros);

  arma::umat finite(V.n_rows, m);
  for (arma::uword j = 0; j < m; ++j)
    for (arma::uword r = 0; r < V.n_rows; ++r)
      finite(r, j) = std::isfinite(V(r, j)) ? 1 : 0;

  for (arma::uword i = 0; i < m; ++i) {
    const arma::vec vi = V.col(i);
    for (arma::uword j = 0; j < m; ++j) {
      const arma::uvec idx = arma::find(finite.col(i) % finite.col(j));
      if (idx.n_elem < 2) continue;
      counts(i, j) = static_cast<double>(idx.n_elem);

      const arma::vec vj = V.col(j);
      const arma::vec u = vi.elem(idx);
      const arma::vec v = vj.elem(idx);
      const arma::vec d = u - v;

      for (size_t k = 0; k < metrics.size(); ++k) {
        switch (metrics[k]) {
          case Metric::euclidean:
            D[k](i, j) = std::sqrt(arma::accu(arma::square(d)));
            break;
          case Metric::correlation:
            if (arma::var(u) < kMinVariance || arma::var(v) < kMinVariance) break;
            D[k](i, j) = arma::as_scalar(arma::cor(u, v));
            break;
          case Metric::mad:
            D[k](i, j) = arma::mean(arma::abs(d));
            break;
          case Metric::rmsd:
            D[k](i, j) = std::sqrt(arma::mean(arma::square(d)));
            break;
          case Metric::chi_square:
            // one-sided: only the second vector enters the denominator
            D[k](i, j) = arma::accu(arma::square(d) / (v + eps));
            break;
        }
      }
    }
  }

  for (size_t k = 0; k < metrics.size(); ++k)
    out.matrices[axis + "|" + metric_name_(metrics[k])] = std::move(D[k]);
  out.matrices[axis + "|counts"] = std::move(counts);

  if (cfg_.verbose)
    log(axis + ": " + std::to_string(m) + "x" + std::to_string(m) + " over " +
        std::to_string(metrics.size()) + " metric(s)");
}

template <class Axis>
DistanceResult DistanceEngine::run(const Container<Axis>& c) const {
  require_valid(c);
  const std::vector<Metric> metrics = resolve_metrics_();

  arma::mat X = dense_(c.values, c.n, c.p);
  if (cfg_.standardise) {
    standardise_columns_(X);
    if (cfg_.verbose) log("standardised " + std::to_string(c.p) + " feature(s)");
  }

  DistanceResult out;
  out.features = c.features;
  out.entries = c.entries;
  if (c.p > 1) axis_pass_(X, "features", metrics, out);
  if (c.n > 1) axis_pass_(X.t(), "entries", metrics, out);

  if (out.matrices.empty())
    throw DataTooSparse(std::string(Axis::kind) + " struct is too sparse. No distance matrix was calculated.");
  return out;
}

template <class Axis>
DistanceResult distances(const Container<Axis>& c,
                         const std::vector<std::string>& metrics,
                         bool standardise) {
  DistanceConfig cfg;
  cfg.metrics = metrics;
  cfg.standardise = standardise;
  return DistanceEngine(cfg).run(c);
}

template DistanceResult DistanceEngine::run<GenomicAxis>(const Genomes&) const;
template DistanceResult DistanceEngine::run<PhenomicAxis>(const Phenomes&) const;
template DistanceResult distances<GenomicAxis>(const Genomes&, const std::vector<std::string>&, bool);
template DistanceResult distances<PhenomicAxis>(const Phenomes&, const std::vector<std::string>&, bool);

} // namespace gbcore
