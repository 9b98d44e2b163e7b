#include <cmath>
#include <limits>

#include "errors.h"
#include "genotype_array.h"

namespace genocol {

namespace {
constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
}  // namespace

void GenotypeArray::CheckBiallelic(const char* encoding) const {
    if (variant_->NumAlleles() != 2) {
        throw UnsupportedMultiAllelic(std::string(encoding) + " encoding needs exactly one alternate allele, " +
                                      variant_->ToString() + " has " +
                                      std::to_string(variant_->NumAlleles() - 1));
    }
}

std::vector<double> GenotypeArray::EncodeAdditive() const {
    CheckBiallelic("additive");
    std::vector<double> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowHasMissingAllele(row)) {
            out[row] = kNaN;
            continue;
        }
        const uint8_t* rec = AlleleIdxs(row);
        int alt_copies = 0;
        for (std::size_t k = 0; k < Ploidy(); ++k) {
            alt_copies += rec[k] != 0;
        }
        out[row] = alt_copies;
    }
    return out;
}

std::vector<double> GenotypeArray::EncodeDominant() const {
    CheckBiallelic("dominant");
    std::vector<double> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowHasMissingAllele(row)) {
            out[row] = kNaN;
            continue;
        }
        // sorted: the last allele is non-reference if any is
        out[row] = AlleleIdxs(row)[Ploidy() - 1] != 0 ? 1.0 : 0.0;
    }
    return out;
}

std::vector<double> GenotypeArray::EncodeRecessive() const {
    CheckBiallelic("recessive");
    std::vector<double> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowHasMissingAllele(row)) {
            out[row] = kNaN;
            continue;
        }
        out[row] = AlleleIdxs(row)[0] != 0 ? 1.0 : 0.0;
    }
    return out;
}

std::vector<Codominant> GenotypeArray::EncodeCodominant() const {
    if (Ploidy() != 2) {
        throw UnsupportedPloidy("codominant encoding needs diploid genotypes, " + variant_->ToString() +
                                " has ploidy " + std::to_string(Ploidy()));
    }
    CheckBiallelic("codominant");
    std::vector<Codominant> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowHasMissingAllele(row)) {
            out[row] = Codominant::Missing;
            continue;
        }
        const uint8_t* rec = AlleleIdxs(row);
        int alt_copies = (rec[0] != 0) + (rec[1] != 0);
        out[row] = static_cast<Codominant>(alt_copies);
    }
    return out;
}

/*
 * EDGE encoding: heterozygotes take an externally estimated weight instead
 * of the additive 0.5. Rows holding any allele other than ref/alt are NaN.
 */
std::vector<double> GenotypeArray::EncodeWeighted(double alpha, const std::string& ref_allele,
                                                  const std::string& alt_allele, double minor_allele_freq) const {
    if (!std::isnan(minor_allele_freq) && (minor_allele_freq < 0.0 || minor_allele_freq > 1.0)) {
        throw InvalidValue("minor allele frequency " + std::to_string(minor_allele_freq) + " is outside [0, 1]");
    }
    const uint8_t ref_idx = ResolveAllele(ref_allele);
    const uint8_t alt_idx = ResolveAllele(alt_allele);
    if (ref_idx == alt_idx) {
        throw InvalidValue("reference and alternate allele are both '" + ref_allele + "'");
    }

    const std::size_t ploidy = Ploidy();
    std::vector<double> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        std::size_t ref_count = 0;
        std::size_t alt_count = 0;
        for (std::size_t k = 0; k < ploidy; ++k) {
            ref_count += rec[k] == ref_idx;
            alt_count += rec[k] == alt_idx;
        }
        if (ref_count + alt_count != ploidy) {
            out[row] = kNaN;
        } else if (ref_count == ploidy) {
            out[row] = 0.0;
        } else if (alt_count == ploidy) {
            out[row] = 1.0;
        } else {
            out[row] = alpha;
        }
    }
    return out;
}

}  // namespace genocol
