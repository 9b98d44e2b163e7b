#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "genotype.h"
#include "variant.h"

namespace genocol {

// Three-level codominant encoding, ordered Ref < Het < Hom.
enum class Codominant : int8_t { Missing = -1, Ref = 0, Het = 1, Hom = 2 };
const char* CodominantName(Codominant c);

enum class CompareOp { Eq, Ne, Lt, Le, Gt, Ge };

/**
 * @brief Genotype calls of many samples at one variant.
 *
 * Rows are packed back to back as {allele_idxs[ploidy], score}, so the
 * record stride is ploidy + 1 bytes. Every allele entry is either
 * kMissingIdx or a valid index into the shared variant's palette, and each
 * row is stored in canonical (sorted) order. The number of rows is fixed
 * once the array is built.
 */
class GenotypeArray {
public:
    static constexpr int64_t kNaCode = -1;

    // Empty column of an anonymous variant.
    GenotypeArray();
    // `size` fully missing rows.
    explicit GenotypeArray(VariantPtr variant, std::size_t size = 0);

    // Takes ownership of a packed record buffer after validating it.
    static GenotypeArray FromRawRecords(VariantPtr variant, std::vector<uint8_t> records);
    // With no variant given, the first genotype's variant is used.
    static GenotypeArray FromGenotypes(const std::vector<Genotype>& genotypes, VariantPtr variant = nullptr);
    static GenotypeArray FromStrings(const std::vector<std::string>& genotypes, const VariantPtr& variant,
                                     const std::string& sep = "/", bool add_alleles = false);
    // Copies another column; a given variant must equal the column's own.
    static GenotypeArray FromArray(const GenotypeArray& other, const VariantPtr& variant = nullptr);

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    const VariantPtr& GetVariant() const { return variant_; }
    uint8_t Ploidy() const { return variant_->Ploidy(); }
    std::size_t RecordSize() const { return static_cast<std::size_t>(variant_->Ploidy()) + 1; }
    const std::vector<uint8_t>& Records() const { return records_; }
    std::size_t NBytes() const { return records_.size(); }

    // Row accessors without bounds checks.
    const uint8_t* AlleleIdxs(std::size_t row) const { return records_.data() + row * RecordSize(); }
    uint8_t ScoreAt(std::size_t row) const { return records_[row * RecordSize() + Ploidy()]; }
    bool RowIsMissing(std::size_t row) const;
    bool RowHasMissingAllele(std::size_t row) const;

    // Negative positions count from the end.
    Genotype At(int64_t i) const;
    Genotype operator[](std::size_t i) const { return At(static_cast<int64_t>(i)); }
    Genotype MissingValue() const;

    GenotypeArray Slice(std::size_t start, std::size_t stop, std::size_t step = 1) const;
    GenotypeArray Mask(const std::vector<bool>& keep) const;
    // With allow_fill, -1 yields fill_value (missing by default); otherwise negatives count from the end.
    GenotypeArray Take(const std::vector<int64_t>& indices, bool allow_fill = false,
                       const Genotype* fill_value = nullptr) const;
    // Deep copy, including a private copy of the variant.
    GenotypeArray Copy() const;

    void Set(std::size_t i, const Genotype& gt);
    void Set(const std::vector<bool>& mask, const Genotype& gt);

    std::vector<bool> IsNa() const;
    std::vector<bool> IsHomozygous() const;
    std::vector<bool> IsHeterozygous() const;
    std::vector<bool> IsHomozygousRef() const;
    std::vector<bool> IsHomozygousAlt() const;
    // NaN where the score is missing.
    std::vector<double> GtScores() const;
    std::vector<std::string> ToStrings(const std::string& sep = "/") const;

    // Codes index into `uniques` (may be null) in first-seen order; missing rows get kNaCode.
    std::vector<int64_t> Factorize(GenotypeArray* uniques) const;
    GenotypeArray Unique() const;
    // Sorted by descending count, ties in first-seen order.
    std::vector<std::pair<Genotype, std::size_t>> ValueCounts(bool dropna = true) const;

    static GenotypeArray Concat(const std::vector<GenotypeArray>& arrays);

    void SetReference(const std::string& allele);
    void SetReference(int allele_idx);

    std::vector<bool> Compare(const Genotype& other, CompareOp op) const;
    std::vector<bool> Compare(const GenotypeArray& other, CompareOp op) const;
    // Same variant and identical allele indices and scores row by row.
    bool Equals(const GenotypeArray& other) const;

    // Encodings; all but EncodeWeighted need exactly one alternate allele.
    std::vector<double> EncodeAdditive() const;
    std::vector<double> EncodeDominant() const;
    std::vector<double> EncodeRecessive() const;
    std::vector<Codominant> EncodeCodominant() const;
    std::vector<double> EncodeWeighted(double alpha, const std::string& ref_allele, const std::string& alt_allele,
                                       double minor_allele_freq) const;

    double Maf() const;
    double HwePval() const;

private:
    GenotypeArray(VariantPtr variant, std::vector<uint8_t> records, std::size_t size);

    uint8_t* MutableRow(std::size_t row) { return records_.data() + row * RecordSize(); }
    void CheckBiallelic(const char* encoding) const;
    uint8_t ResolveAllele(const std::string& allele) const;
    void AppendRow(std::vector<uint8_t>& out, std::size_t row) const;
    std::size_t NormalizeIndex(int64_t i) const;

    VariantPtr variant_;
    std::vector<uint8_t> records_;
    std::size_t size_;
};

}  // namespace genocol
