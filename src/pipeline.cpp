// pipeline.cpp
// ------------------------------------------------------------------
// High-level orchestration: reads one or two containers, applies the
// configured transformations in a fixed order and writes the results.
// This implements gbcore::run_pipeline().
// ------------------------------------------------------------------

#include "pipeline.hpp"
#include "composite_trait.hpp"
#include "table_io.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

namespace gbcore {

static inline std::string shape(int n, int p) {
  return std::to_string(n) + "x" + std::to_string(p);
}

template <class Axis>
static Container<Axis> load_(const std::string& table, const std::string& mask, char delim, bool verbose) {
  Container<Axis> c = read_container<Axis>(table, delim);
  if (!mask.empty()) read_mask(mask, c, delim);
  if (verbose)
    std::cout << "[load] " << table << ": " << shape(c.n, c.p) << " " << Axis::kind << "\n";
  return c;
}

template <class Axis>
static PipelineResult run_(const PipelineConfig& cfg, const Paths& paths) {
  if (paths.table.empty()) throw std::invalid_argument("No input table provided (paths.table).");
  const char delim = cfg.delimiter ? cfg.delimiter : Axis::delimiter;
  PipelineResult res;

  Container<Axis> c = load_<Axis>(paths.table, paths.mask, delim, cfg.verbose);

  if (!paths.other.empty()) {
    const Container<Axis> other = load_<Axis>(paths.other, paths.other_mask, delim, cfg.verbose);
    MergeConfig mc = cfg.merge;
    mc.verbose = mc.verbose || cfg.verbose;
    c = MergeEngine(mc).run(c, other);
    std::cout << "[merge] " << shape(c.n, c.p) << "\n";
  }

  if (cfg.slice_entries || cfg.slice_features) {
    c = slice(c, cfg.slice_entries, cfg.slice_features);
    std::cout << "[slice] " << shape(c.n, c.p) << "\n";
  }

  if (cfg.filter) {
    c = filter(c);
    std::cout << "[filter] " << shape(c.n, c.p) << "\n";
    if (c.n == 0 || c.p == 0)
      std::cerr << "[warn] filter dropped every " << (c.n == 0 ? "entry" : Axis::feature_label) << "\n";
  }

  for (const auto& cs : cfg.composites) {
    c = add_composite_feature(c, cs.name, cs.formula);
    std::cout << "[composite] " << cs.name << " = " << cs.formula << "\n";
  }

  if (!paths.out_prefix.empty()) {
    const std::string ext = delim == ',' ? ".csv" : ".tsv";
    const std::string table_out = paths.out_prefix + ".table" + ext;
    const std::string mask_out  = paths.out_prefix + ".mask" + ext;
    write_table(c, table_out, delim);
    write_mask(c, mask_out, delim);
    res.written.push_back(table_out);
    res.written.push_back(mask_out);
  }

  if (cfg.run_distances) {
    DistanceConfig dc = cfg.distances;
    dc.verbose = dc.verbose || cfg.verbose;
    const DistanceResult d = DistanceEngine(dc).run(c);
    std::cout << "[distances] " << d.matrices.size() << " matrices\n";
    if (!paths.out_prefix.empty()) {
      auto w = write_distances(d, paths.out_prefix, delim);
      res.written.insert(res.written.end(), w.begin(), w.end());
    } else {
      std::cerr << "[note] no output prefix; distance matrices not written\n";
    }
  }

  res.dimensions = dimensions(c);
  return res;
}

PipelineResult run_pipeline(const PipelineConfig& cfg, const Paths& paths) {
  if (cfg.kind == "phenomes") return run_<PhenomicAxis>(cfg, paths);
  if (cfg.kind == "genomes")  return run_<GenomicAxis>(cfg, paths);
  throw std::invalid_argument("Unknown kind '" + cfg.kind + "' (expected phenomes or genomes)");
}

} // namespace gbcore
