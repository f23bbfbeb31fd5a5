// genomes.cpp
// ------------------------------------------------------------------
// Locus-allele descriptor parsing and the genomic summary.
// ------------------------------------------------------------------

#include "genomes.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace gbcore {

static std::vector<std::string> split_simple(const std::string& s, char delim) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == delim) { out.push_back(cur); cur.clear(); }
    else            { cur.push_back(c); }
  }
  out.push_back(cur);
  return out;
}

static bool is_integer(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

LociAlleles loci_alleles(const Genomes& genomes) {
  require_valid(genomes);
  LociAlleles out;
  const size_t p = genomes.features.size();
  out.chromosomes.reserve(p);
  out.positions.reserve(p);
  out.alleles.reserve(p);
  out.n_alleles.reserve(p);
  for (const auto& la : genomes.features) {
    auto toks = split_simple(la, '\t');
    if (toks.size() != 4 || toks[0].empty() || !is_integer(toks[1]) || toks[2].empty())
      throw std::invalid_argument("Malformed locus-allele descriptor (expected chrom\\tpos\\talleles\\tallele): '" + la + "'");
    out.chromosomes.push_back(toks[0]);
    out.positions.push_back(std::stoll(toks[1]));
    out.alleles.push_back(toks[3]);
    out.n_alleles.push_back(static_cast<int>(split_simple(toks[2], '|').size()));
  }
  return out;
}

Loci loci(const Genomes& genomes) {
  const LociAlleles la = loci_alleles(genomes);
  Loci out;
  const int p = static_cast<int>(la.chromosomes.size());
  for (int j = 0; j < p; ++j) {
    const bool same_locus = !out.chromosomes.empty() &&
                            out.chromosomes.back() == la.chromosomes[j] &&
                            out.positions.back() == la.positions[j];
    if (same_locus) {
      out.loci_fin_idx.back() = j + 1;
      continue;
    }
    out.chromosomes.push_back(la.chromosomes[j]);
    out.positions.push_back(la.positions[j]);
    out.loci_ini_idx.push_back(j + 1);
    out.loci_fin_idx.push_back(j + 1);
  }
  return out;
}

std::map<std::string, long long> dimensions(const Genomes& genomes) {
  require_valid(genomes);
  const LociAlleles la = loci_alleles(genomes);
  const Loci lc = loci(genomes);

  std::set<std::string> chroms(la.chromosomes.begin(), la.chromosomes.end());
  int max_n_alleles = 0;
  for (int a : la.n_alleles) max_n_alleles = std::max(max_n_alleles, a);

  long long n_missing = 0;
  for (const auto& v : genomes.values) if (!v) ++n_missing;

  std::unordered_set<std::string> pops(genomes.populations.begin(), genomes.populations.end());
  std::unordered_set<std::string> ents(genomes.entries.begin(), genomes.entries.end());
  return {
    {"n_entries",      static_cast<long long>(ents.size())},
    {"n_populations",  static_cast<long long>(pops.size())},
    {"n_loci_alleles", static_cast<long long>(genomes.p)},
    {"n_chr",          static_cast<long long>(chroms.size())},
    {"n_loci",         static_cast<long long>(lc.chromosomes.size())},
    {"max_n_alleles",  static_cast<long long>(max_n_alleles)},
    {"n_missing",      n_missing},
  };
}

} // namespace gbcore
