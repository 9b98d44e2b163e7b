#include "random_gt.h"

#include <cmath>
#include <random>

#include "errors.h"

namespace genocol {

GenotypeArray GenerateRandomGt(const VariantPtr& variant, const std::vector<double>& allele_freq, std::size_t n,
                               uint32_t random_seed) {
    if (!variant) {
        throw InvalidValue("random genotypes need a variant");
    }
    if (allele_freq.size() != variant->NumAlleles()) {
        throw InvalidValue(std::to_string(allele_freq.size()) + " allele frequencies given for " +
                           std::to_string(variant->NumAlleles()) + " alleles of " + variant->ToString());
    }
    double total = 0.0;
    for (double f : allele_freq) {
        if (!(f >= 0.0)) {
            throw InvalidValue("allele frequencies must be non-negative");
        }
        total += f;
    }
    if (std::fabs(total - 1.0) > 1e-9) {
        throw InvalidValue("allele frequencies sum to " + std::to_string(total) + " instead of 1");
    }

    std::mt19937 rng(random_seed);
    std::discrete_distribution<int> dist(allele_freq.begin(), allele_freq.end());
    const std::size_t ploidy = variant->Ploidy();
    std::vector<uint8_t> records;
    records.reserve(n * (ploidy + 1));
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t k = 0; k < ploidy; ++k) {
            records.push_back(static_cast<uint8_t>(dist(rng)));
        }
        records.push_back(kMissingScore);
    }
    return GenotypeArray::FromRawRecords(variant, std::move(records));
}

}  // namespace genocol
