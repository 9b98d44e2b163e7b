#pragma once

#include <cstdint>
#include <vector>

#include "genotype_array.h"

namespace genocol {

constexpr uint32_t kDefaultRandomSeed = 1855;

// Draws each allele of each of `n` genotypes independently from
// `allele_freq` (one frequency per palette entry, summing to 1).
GenotypeArray GenerateRandomGt(const VariantPtr& variant, const std::vector<double>& allele_freq, std::size_t n,
                               uint32_t random_seed = kDefaultRandomSeed);

}  // namespace genocol
