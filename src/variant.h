#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace genocol {

// Sentinel for an unobserved allele; never a valid palette position.
constexpr uint8_t kMissingIdx = 255;
// Sentinel for an absent quality score.
constexpr uint8_t kMissingScore = 255;
constexpr std::size_t kMaxAlleles = 254;
constexpr uint32_t kMaxPosition = 2147483646;  // 2^31 - 2

class Genotype;
class GenotypeArray;
class Variant;
using VariantPtr = std::shared_ptr<Variant>;

/**
 * @brief Identity and allele palette of one genomic site.
 *
 * The palette holds the reference allele at index 0 followed by alternates.
 * It only grows (AddAllele); the one reordering is the swap performed by
 * GenotypeArray::SetReference on a column that owns the variant exclusively.
 *
 * Genotype factories bind the result to this object through
 * shared_from_this(), so a Variant must be owned by a shared_ptr
 * (see Variant::Create) before they are called.
 */
class Variant : public std::enable_shared_from_this<Variant> {
public:
    Variant(std::string chromosome = "",
            uint32_t position = 0,
            std::string id = "",
            const std::string& ref = "N",
            const std::vector<std::string>& alt = {},
            uint8_t ploidy = 2,
            uint8_t score = kMissingScore);

    static VariantPtr Create(std::string chromosome = "",
                             uint32_t position = 0,
                             std::string id = "",
                             const std::string& ref = "N",
                             const std::vector<std::string>& alt = {},
                             uint8_t ploidy = 2,
                             uint8_t score = kMissingScore);

    // Empty when the chromosome is unknown.
    const std::string& Chromosome() const { return chromosome_; }
    uint32_t Position() const { return position_; }
    const std::string& Id() const { return id_; }
    uint8_t Ploidy() const { return ploidy_; }
    std::optional<uint8_t> Score() const;
    uint8_t RawScore() const { return score_; }

    const std::vector<std::string>& Alleles() const { return alleles_; }
    const std::string& Ref() const { return alleles_[0]; }
    std::vector<std::string> AltAlleles() const;
    // Alternate alleles joined with ','; empty when there are none.
    std::string Alt() const;
    std::size_t NumAlleles() const { return alleles_.size(); }
    bool IsBiallelic() const { return alleles_.size() == 2; }

    // Appends a new allele and returns its index; existing alleles return their index.
    uint8_t AddAllele(const std::string& allele);

    // "." or "" map to kMissingIdx.
    uint8_t GetIdxFromAllele(const std::string& allele, bool add = false);
    const std::string& GetAlleleFromIdx(uint8_t idx) const;
    bool IsValidAlleleIdx(int idx) const;

    // Same id, chromosome, position, reference and ploidy; alternates may differ.
    bool IsSamePosition(const Variant& other) const;

    bool operator==(const Variant& other) const;
    bool operator!=(const Variant& other) const { return !(*this == other); }

    std::string ToString() const;
    VariantPtr Clone() const;

    Genotype MakeGenotype(const std::vector<std::string>& alleles, bool add = false,
                          uint8_t score = kMissingScore);
    Genotype MakeGenotypeFromStr(const std::string& gt_str, const std::string& sep = "/", bool add = false,
                                 uint8_t score = kMissingScore);
    Genotype MakeGenotypeFromPlinkBits(const std::string& code);
    // -1 marks a missing allele, as produced by VCF readers.
    Genotype MakeGenotypeFromVcfRecord(const std::vector<int32_t>& allele_idxs, uint8_t score = kMissingScore);

private:
    friend class GenotypeArray;

    void SwapWithReference(uint8_t idx);
    static void ValidateAllele(const std::string& allele);

    std::string chromosome_;
    uint32_t position_;
    std::string id_;
    std::vector<std::string> alleles_;
    uint8_t ploidy_;
    uint8_t score_;
};

// genotype(<ploidy>n)[<chromosome>; <position>; <id>; <ref>; <alt,...>] with optional Q<score>
std::string FormatDtype(const Variant& variant);
VariantPtr ParseDtype(const std::string& dtype);

}  // namespace genocol
