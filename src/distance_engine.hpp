#pragma once
#include "gbcore.hpp"
#include <armadillo>
#include <map>
#include <string>
#include <vector>

namespace gbcore {

struct DistanceConfig {
  // Any of: euclidean, correlation, mad, rmsd, chi_square. Duplicates are dropped.
  std::vector<std::string> metrics{"euclidean", "correlation", "mad", "rmsd", "chi_square"};
  bool standardise{false};   // z-score every feature over its finite cells first
  bool verbose{false};
};

// Keys are "<axis>|<metric>" and "<axis>|counts", axis in {features, entries}.
// Cells without at least two jointly finite positions hold -inf; counts hold 0 there.
struct DistanceResult {
  std::vector<std::string> features;
  std::vector<std::string> entries;
  std::map<std::string, arma::mat> matrices;
};

class DistanceEngine {
public:
  explicit DistanceEngine(const DistanceConfig& cfg);

  // Feature-by-feature pass if p > 1, entry-by-entry pass if n > 1.
  // Throws DataTooSparse when neither pass runs.
  template <class Axis>
  DistanceResult run(const Container<Axis>& c) const;

  static const std::vector<std::string>& recognised_metrics();

private:
  enum class Metric { euclidean, correlation, mad, rmsd, chi_square };

  DistanceConfig cfg_;

  std::vector<Metric> resolve_metrics_() const;
  static arma::mat dense_(const std::vector<Cell>& values, int n, int p);
  static void standardise_columns_(arma::mat& X);
  // Each column of V is one vector of the axis being compared.
  void axis_pass_(const arma::mat& V, const std::string& axis,
                  const std::vector<Metric>& metrics, DistanceResult& out) const;
  static const char* metric_name_(Metric m);
};

template <class Axis>
DistanceResult distances(const Container<Axis>& c,
                         const std::vector<std::string>& metrics =
                           {"euclidean", "correlation", "mad", "rmsd", "chi_square"},
                         bool standardise = false);

} // namespace gbcore
