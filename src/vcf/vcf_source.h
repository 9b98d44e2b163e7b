#pragma once

#include <htslib/hts.h>
#include <htslib/vcf.h>

#include <cstdint>
#include <optional>
#include <string>

#include "../genotype_table.h"
#include "../samples.h"

namespace genocol {

struct VcfSourceOptions {
    // Skip records whose QUAL is missing or below this value.
    std::optional<double> min_qual;
    // Skip records with a FILTER other than PASS.
    bool drop_filtered = false;
};

/**
 * @brief Reads VCF/BCF files (plain, bgzipped or binary) through htslib and
 * yields one GenotypeArray per record.
 *
 * The record's QUAL (rounded, clipped to 0-254) becomes the variant score
 * and FORMAT/GQ, when present, the per-sample genotype score.
 */
class VcfSource {
public:
    explicit VcfSource(const VcfSourceOptions& options = VcfSourceOptions());
    ~VcfSource();

    VcfSource(const VcfSource&) = delete;
    VcfSource& operator=(const VcfSource&) = delete;

    void Open(const std::string& filename);
    const SampleTable& Samples() const { return samples_; }

    // Returns false at the end of the file.
    bool Next(GenotypeArray& column);
    GenotypeTable ReadAll();

    uint64_t NumRead() const { return no_read_; }
    uint64_t NumSkipped() const { return no_skipped_; }

    void Close();

private:
    bool Keep();
    VariantPtr BuildVariant(uint8_t ploidy);

    VcfSourceOptions options_;
    std::string filename_;
    htsFile* fp_hts_ = nullptr;
    bcf_hdr_t* hdr_ = nullptr;
    bcf1_t* rec_ = nullptr;
    int32_t* gt_arr_ = nullptr;
    int n_gt_arr_ = 0;
    int32_t* gq_arr_ = nullptr;
    int n_gq_arr_ = 0;
    SampleTable samples_;
    uint64_t no_read_ = 0;
    uint64_t no_skipped_ = 0;
};

}  // namespace genocol
