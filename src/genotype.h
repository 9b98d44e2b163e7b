#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "variant.h"

namespace genocol {

/**
 * @brief One sample's call at a Variant.
 *
 * Allele indices are kept sorted ascending and padded with kMissingIdx up to
 * the variant's ploidy. Equality, ordering and hashing use that canonical
 * tuple; the score does not take part in identity.
 */
class Genotype {
public:
    Genotype(VariantPtr variant, std::vector<uint8_t> allele_idxs = {}, uint8_t score = kMissingScore);

    const VariantPtr& GetVariant() const { return variant_; }
    const std::vector<uint8_t>& AlleleIdxs() const { return allele_idxs_; }
    std::vector<std::string> Alleles() const;
    // nullopt for a missing allele
    std::optional<uint8_t> AlleleAt(std::size_t i) const;

    std::optional<uint8_t> Score() const;
    uint8_t RawScore() const { return score_; }

    bool IsMissing() const;
    bool HasMissingAllele() const;
    bool IsHomozygous() const;
    bool IsHeterozygous() const;

    // Fully missing calls render as ".".
    std::string ToString(const std::string& sep = "/") const;

    bool operator==(const Genotype& other) const;
    bool operator!=(const Genotype& other) const;
    bool operator<(const Genotype& other) const;
    bool operator<=(const Genotype& other) const;
    bool operator>(const Genotype& other) const;
    bool operator>=(const Genotype& other) const;

    std::size_t Hash() const;

private:
    void CheckComparable(const Genotype& other) const;

    VariantPtr variant_;
    std::vector<uint8_t> allele_idxs_;
    uint8_t score_;
};

// Same object or equal by value.
bool SameVariant(const VariantPtr& a, const VariantPtr& b);

std::ostream& operator<<(std::ostream& os, const Genotype& gt);

}  // namespace genocol

namespace std {
template <>
struct hash<genocol::Genotype> {
    std::size_t operator()(const genocol::Genotype& gt) const { return gt.Hash(); }
};
}  // namespace std
