#pragma once
#include "gbcore.hpp"
#include <string>
#include <vector>

namespace gbcore {

// Parsed "<chrom>\t<pos>\t<allele|allele|...>\t<allele>" descriptors, one per feature.
struct LociAlleles {
  std::vector<std::string> chromosomes;
  std::vector<long long>   positions;
  std::vector<std::string> alleles;      // the allele this column measures
  std::vector<int>         n_alleles;    // alleles listed at the locus
};

// Consecutive loci-alleles sharing chromosome and position collapse into one locus.
// ini/fin are 1-based inclusive feature positions.
struct Loci {
  std::vector<std::string> chromosomes;
  std::vector<long long>   positions;
  std::vector<int>         loci_ini_idx;
  std::vector<int>         loci_fin_idx;
};

LociAlleles loci_alleles(const Genomes& genomes);
Loci        loci(const Genomes& genomes);

} // namespace gbcore
