#include "genotype.h"

#include <algorithm>

#include "errors.h"

namespace genocol {

bool SameVariant(const VariantPtr& a, const VariantPtr& b) {
    if (a == b) {
        return true;
    }
    return a && b && *a == *b;
}

Genotype::Genotype(VariantPtr variant, std::vector<uint8_t> allele_idxs, uint8_t score)
    : variant_(std::move(variant)), allele_idxs_(std::move(allele_idxs)), score_(score) {
    if (!variant_) {
        throw InvalidValue("a Genotype needs a variant");
    }
    const std::size_t ploidy = variant_->Ploidy();
    if (allele_idxs_.size() > ploidy) {
        throw TooManyAlleles(std::to_string(allele_idxs_.size()) + " alleles given for variant " + variant_->Id() +
                             " with ploidy " + std::to_string(ploidy));
    }
    for (uint8_t idx : allele_idxs_) {
        if (!variant_->IsValidAlleleIdx(idx)) {
            throw InvalidAlleleIndex("allele index " + std::to_string(idx) + " is invalid for variant " +
                                     variant_->Id());
        }
    }
    allele_idxs_.resize(ploidy, kMissingIdx);
    std::sort(allele_idxs_.begin(), allele_idxs_.end());
}

std::vector<std::string> Genotype::Alleles() const {
    std::vector<std::string> out;
    out.reserve(allele_idxs_.size());
    for (uint8_t idx : allele_idxs_) {
        out.push_back(variant_->GetAlleleFromIdx(idx));
    }
    return out;
}

std::optional<uint8_t> Genotype::AlleleAt(std::size_t i) const {
    if (i >= allele_idxs_.size()) {
        throw IndexOutOfBounds("allele position " + std::to_string(i) + " exceeds ploidy " +
                               std::to_string(allele_idxs_.size()));
    }
    if (allele_idxs_[i] == kMissingIdx) {
        return std::nullopt;
    }
    return allele_idxs_[i];
}

std::optional<uint8_t> Genotype::Score() const {
    if (score_ == kMissingScore) {
        return std::nullopt;
    }
    return score_;
}

bool Genotype::IsMissing() const {
    return std::all_of(allele_idxs_.begin(), allele_idxs_.end(), [](uint8_t a) { return a == kMissingIdx; });
}

bool Genotype::HasMissingAllele() const {
    // sorted, so a missing allele is always last
    return !allele_idxs_.empty() && allele_idxs_.back() == kMissingIdx;
}

bool Genotype::IsHomozygous() const {
    return !HasMissingAllele() && allele_idxs_.front() == allele_idxs_.back();
}

bool Genotype::IsHeterozygous() const {
    return !HasMissingAllele() && allele_idxs_.front() != allele_idxs_.back();
}

std::string Genotype::ToString(const std::string& sep) const {
    if (IsMissing()) {
        return ".";
    }
    std::string out;
    for (std::size_t i = 0; i < allele_idxs_.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += variant_->GetAlleleFromIdx(allele_idxs_[i]);
    }
    return out;
}

void Genotype::CheckComparable(const Genotype& other) const {
    if (!SameVariant(variant_, other.variant_)) {
        throw IncompatibleVariant("cannot compare genotypes of variants " + variant_->ToString() + " and " +
                                  other.variant_->ToString());
    }
}

bool Genotype::operator==(const Genotype& other) const {
    CheckComparable(other);
    return allele_idxs_ == other.allele_idxs_;
}

bool Genotype::operator!=(const Genotype& other) const {
    return !(*this == other);
}

bool Genotype::operator<(const Genotype& other) const {
    CheckComparable(other);
    return allele_idxs_ < other.allele_idxs_;
}

bool Genotype::operator<=(const Genotype& other) const {
    CheckComparable(other);
    return allele_idxs_ <= other.allele_idxs_;
}

bool Genotype::operator>(const Genotype& other) const {
    return !(*this <= other);
}

bool Genotype::operator>=(const Genotype& other) const {
    return !(*this < other);
}

std::size_t Genotype::Hash() const {
    std::size_t h = std::hash<std::string>()(variant_->Id());
    for (uint8_t idx : allele_idxs_) {
        h ^= std::hash<uint8_t>()(idx) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

std::ostream& operator<<(std::ostream& os, const Genotype& gt) {
    return os << gt.ToString();
}

}  // namespace genocol
