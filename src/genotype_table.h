#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "genotype_array.h"
#include "samples.h"

namespace genocol {

struct VariantInfoRow {
    std::string column;
    std::string chromosome;
    uint32_t position = 0;
    std::string id;
    std::string ref;
    std::string alt;
    uint8_t ploidy = 2;
    std::optional<uint8_t> score;
};

// Heterozygote weight estimated elsewhere for one variant.
struct EncodingInfo {
    std::string variant_id;
    double alpha_value = 0.5;
    std::string ref_allele;
    std::string alt_allele;
    double minor_allele_freq = 0.0;
};

struct EncodedColumn {
    std::string name;
    std::vector<double> values;
};

struct CodominantColumn {
    std::string name;
    std::vector<Codominant> values;
};

struct WeightedEncodingResult {
    std::vector<EncodedColumn> columns;
    // Column names that had encoding info but could not be encoded.
    std::vector<std::string> skipped;
};

/**
 * @brief Samples in rows, one GenotypeArray per variant in columns.
 */
class GenotypeTable {
public:
    GenotypeTable() = default;
    explicit GenotypeTable(SampleTable samples);

    const SampleTable& Samples() const { return samples_; }
    std::size_t NumSamples() const { return samples_.size(); }
    std::size_t NumVariants() const { return columns_.size(); }

    void AddColumn(const std::string& name, GenotypeArray column);
    const std::vector<std::string>& ColumnNames() const { return names_; }
    const GenotypeArray& Column(std::size_t i) const { return columns_.at(i); }
    GenotypeArray& Column(std::size_t i) { return columns_.at(i); }
    const GenotypeArray& Column(const std::string& name) const;
    const std::vector<GenotypeArray>& Columns() const { return columns_; }

    std::vector<VariantInfoRow> VariantInfo() const;
    std::vector<double> Maf() const;
    std::vector<double> HwePval() const;

    // Drops columns with a MAF below keep_min_freq; NaN columns are kept.
    GenotypeTable FilterVariantsMaf(double keep_min_freq = 0.01) const;
    // Drops columns with a p-value below cutoff; NaN columns are kept.
    GenotypeTable FilterVariantsHwe(double cutoff = 0.05) const;

    // One encoded column per genotype column, in column order. A column the
    // encoding does not support makes the whole call throw.
    std::vector<EncodedColumn> EncodeAdditive() const;
    std::vector<EncodedColumn> EncodeDominant() const;
    std::vector<EncodedColumn> EncodeRecessive() const;
    std::vector<CodominantColumn> EncodeCodominant() const;

    WeightedEncodingResult EncodeWeighted(const std::vector<EncodingInfo>& encoding_info) const;

private:
    GenotypeTable Subset(const std::vector<bool>& keep) const;

    SampleTable samples_;
    std::vector<std::string> names_;
    std::vector<GenotypeArray> columns_;
    std::unordered_map<std::string, std::size_t> by_name_;
};

}  // namespace genocol
