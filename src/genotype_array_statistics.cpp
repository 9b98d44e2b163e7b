#include <algorithm>
#include <array>
#include <limits>
#include <map>
#include <utility>

#include <boost/math/distributions/chi_squared.hpp>

#include "genotype_array.h"

namespace genocol {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kMinExpectedCount = 5.0;
}  // namespace

double GenotypeArray::Maf() const {
    std::array<uint64_t, 256> counts{};
    uint64_t total = 0;
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        for (std::size_t k = 0; k < Ploidy(); ++k) {
            if (rec[k] != kMissingIdx) {
                ++counts[rec[k]];
                ++total;
            }
        }
    }
    if (total == 0) {
        return kNaN;
    }
    uint64_t top_alt = 0;
    for (std::size_t a = 1; a < kMissingIdx; ++a) {
        top_alt = std::max(top_alt, counts[a]);
    }
    return static_cast<double>(top_alt) / static_cast<double>(total);
}

/*
 * Chi-square goodness of fit of the observed diploid genotype counts against
 * Hardy-Weinberg proportions. Only rows with both alleles called are used.
 * Allele frequencies cover indices 0..highest observed, so a palette entry
 * between observed alleles contributes an expected count of 0 and makes the
 * test NaN. Degrees of freedom are (genotype categories - 1), not corrected
 * for the number of estimated allele frequencies.
 */
double GenotypeArray::HwePval() const {
    if (Ploidy() != 2) {
        return kNaN;
    }
    std::array<uint64_t, 256> allele_counts{};
    std::map<std::pair<uint8_t, uint8_t>, uint64_t> observed;
    uint64_t n = 0;
    std::size_t max_allele = 0;
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowHasMissingAllele(row)) {
            continue;
        }
        const uint8_t* rec = AlleleIdxs(row);
        ++allele_counts[rec[0]];
        ++allele_counts[rec[1]];
        ++observed[std::make_pair(rec[0], rec[1])];
        max_allele = std::max<std::size_t>(max_allele, rec[1]);
        ++n;
    }
    if (n < 2) {
        return kNaN;
    }
    if (max_allele == 0) {
        return 1.0;
    }

    const double total_alleles = 2.0 * static_cast<double>(n);
    const double n_rows = static_cast<double>(n);
    double chi = 0.0;
    std::size_t categories = 0;
    for (std::size_t i = 0; i <= max_allele; ++i) {
        const double fi = static_cast<double>(allele_counts[i]) / total_alleles;
        for (std::size_t j = i; j <= max_allele; ++j) {
            const double fj = static_cast<double>(allele_counts[j]) / total_alleles;
            const double expected = i == j ? fi * fi * n_rows : 2.0 * fi * fj * n_rows;
            if (expected < kMinExpectedCount) {
                return kNaN;
            }
            auto it = observed.find(std::make_pair(static_cast<uint8_t>(i), static_cast<uint8_t>(j)));
            const double obs = it == observed.end() ? 0.0 : static_cast<double>(it->second);
            chi += (obs - expected) * (obs - expected) / expected;
            ++categories;
        }
    }

    boost::math::chi_squared_distribution<double> dist(static_cast<double>(categories - 1));
    return boost::math::cdf(boost::math::complement(dist, chi));
}

}  // namespace genocol
