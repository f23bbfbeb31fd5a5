#pragma once
#include "gbcore.hpp"
#include <string>
#include <vector>

namespace gbcore {

struct MergeConfig {
  // Weights (first, second) applied when both sources hold differing values
  // for the same cell. Exactly two non-negative weights summing to 1.
  std::vector<double> conflict_resolution{0.5, 0.5};
  bool verbose{false};
};

class MergeEngine {
public:
  explicit MergeEngine(const MergeConfig& cfg);

  // Union of entries and features (first's order, then the second's new names).
  // Per cell:
  //  - in both, values equal      -> first's value and mask
  //  - in both, values differ     -> weighted mean (or the non-missing one),
  //                                  mask by weighted vote rounded half to even
  //  - in one source only         -> that source's value and mask
  //  - in neither                 -> missing, unusable
  // Entries found in both with different populations get "CONFLICT (a, b)".
  template <class Axis>
  Container<Axis> run(const Container<Axis>& a, const Container<Axis>& b) const;

private:
  MergeConfig cfg_;
  double w1_{0.5};
  double w2_{0.5};

  void validate_weights_() const;
};

template <class Axis>
Container<Axis> merge(const Container<Axis>& a, const Container<Axis>& b,
                      const std::vector<double>& conflict_resolution = {0.5, 0.5});

} // namespace gbcore
