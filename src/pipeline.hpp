#pragma once
#include "gbcore.hpp"
#include "distance_engine.hpp"
#include "merge_engine.hpp"
#include "slice_engine.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gbcore {

struct Paths {
  std::string table;        // primary container
  std::string mask;         // optional mask for `table`
  std::string other;        // optional second container; triggers a merge
  std::string other_mask;
  std::string out_prefix;   // <prefix>.table.tsv, <prefix>.mask.tsv, <prefix>.<axis>.<metric>.tsv
};

struct CompositeStep {
  std::string name;
  std::string formula;
};

struct PipelineConfig {
  std::string kind{"phenomes"};        // "phenomes" | "genomes"
  char delimiter{0};                   // 0 = the kind's default

  MergeConfig merge;                   // used only when Paths::other is set
  IndexList slice_entries;             // 1-based
  IndexList slice_features;
  bool filter{false};
  std::vector<CompositeStep> composites;

  bool run_distances{false};
  DistanceConfig distances;

  bool verbose{false};
};

struct PipelineResult {
  std::map<std::string, long long> dimensions;
  std::vector<std::string> written;
};

// load -> merge -> slice -> filter -> composite -> write -> distances
PipelineResult run_pipeline(const PipelineConfig& cfg, const Paths& paths);

} // namespace gbcore
