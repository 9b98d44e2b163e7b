#pragma once

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "../genotype_table.h"
#include "../samples.h"
#include "../variant.h"

namespace genocol {
namespace plink {

struct ReaderOptions {
    // Make allele1 (the BIM alternate) the reference after decoding.
    bool swap_alleles = false;
    // Read at most this many variants; must be at least 1 when set.
    std::optional<int64_t> max_variants;
    // Interpret the phenotype column as 1 = control, 2 = case.
    bool categorical_phenotype = false;
};

SampleTable ReadFam(const std::string& path, bool categorical_phenotype = false);
// One biallelic diploid variant per line: ref = allele2, alt = allele1.
std::vector<VariantPtr> ReadBim(const std::string& path, std::optional<int64_t> max_variants = std::nullopt);

void WriteFam(const std::string& path, const SampleTable& samples);
std::string FormatBimLine(const Variant& variant);

/**
 * @brief Streams genotype columns out of a PLINK .bed/.bim/.fam trio.
 *
 * Open() reads the FAM and BIM files completely and checks the BED magic
 * bytes; Next() then decodes one variant record at a time.
 */
class PlinkReader {
public:
    PlinkReader() = default;

    void Open(const std::string& prefix, const ReaderOptions& options = ReaderOptions());

    const SampleTable& Samples() const { return samples_; }
    const std::vector<VariantPtr>& Variants() const { return variants_; }
    std::size_t NumVariants() const { return variants_.size(); }

    // Returns false once every variant has been read.
    bool Next(GenotypeArray& column);

    // Decodes all remaining records, splitting the work over no_threads workers.
    GenotypeTable ReadAll(uint32_t no_threads = 1);

    static std::string ColumnName(std::size_t variant_idx, const Variant& variant);

private:
    void ReadRecord(std::vector<uint8_t>& buffer);
    GenotypeArray DecodeColumn(const uint8_t* bytes, std::size_t variant_idx) const;

    std::string prefix_;
    ReaderOptions options_;
    SampleTable samples_;
    std::vector<VariantPtr> variants_;
    std::ifstream bed_;
    std::size_t next_variant_ = 0;
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Writes genotype columns as a PLINK trio, one column per call.
 */
class PlinkWriter {
public:
    PlinkWriter() = default;
    ~PlinkWriter();

    // Writes the FAM file and the BED magic bytes.
    void Open(const std::string& prefix, const SampleTable& samples);
    void Write(const GenotypeArray& column);
    void Close();

    std::size_t NumWritten() const { return no_written_; }

private:
    std::string prefix_;
    std::size_t no_samples_ = 0;
    std::size_t no_written_ = 0;
    std::ofstream bed_;
    std::ofstream bim_;
    std::vector<uint8_t> buffer_;
};

GenotypeTable ReadPlink(const std::string& prefix, const ReaderOptions& options = ReaderOptions(),
                        uint32_t no_threads = 1);
void WritePlink(const std::string& prefix, const GenotypeTable& table);

}  // namespace plink
}  // namespace genocol
