#include "vcf_source.h"

#include <cmath>
#include <cstdlib>
#include <vector>

#include "../errors.h"
#include "logger.h"

namespace genocol {

namespace {

uint8_t ClipScore(double value) {
    if (std::isnan(value)) {
        return kMissingScore;
    }
    double rounded = std::round(value);
    if (rounded < 0.0) {
        return 0;
    }
    if (rounded > kMissingScore - 1) {
        return kMissingScore - 1;
    }
    return static_cast<uint8_t>(rounded);
}

}  // namespace

VcfSource::VcfSource(const VcfSourceOptions& options) : options_(options) {}

VcfSource::~VcfSource() {
    Close();
}

void VcfSource::Open(const std::string& filename) {
    Close();
    filename_ = filename;

    // hts_open detects VCF, VCF.GZ and BCF
    fp_hts_ = hts_open(filename.c_str(), "r");
    if (!fp_hts_) {
        throw IoError("failed to open file: " + filename);
    }
    hdr_ = bcf_hdr_read(fp_hts_);
    if (!hdr_) {
        Close();
        throw CorruptFile("failed to read VCF/BCF header from: " + filename);
    }
    rec_ = bcf_init();

    std::vector<std::string> ids;
    for (int i = 0; i < bcf_hdr_nsamples(hdr_); ++i) {
        ids.emplace_back(hdr_->samples[i]);
    }
    samples_ = SampleTable::FromIds(ids);
    LogManager::Instance().Logger()->info("Opened '{}' with {} samples", filename, samples_.size());
}

void VcfSource::Close() {
    if (gt_arr_) {
        free(gt_arr_);
        gt_arr_ = nullptr;
        n_gt_arr_ = 0;
    }
    if (gq_arr_) {
        free(gq_arr_);
        gq_arr_ = nullptr;
        n_gq_arr_ = 0;
    }
    if (rec_) {
        bcf_destroy(rec_);
        rec_ = nullptr;
    }
    if (hdr_) {
        bcf_hdr_destroy(hdr_);
        hdr_ = nullptr;
    }
    if (fp_hts_) {
        hts_close(fp_hts_);
        fp_hts_ = nullptr;
    }
}

bool VcfSource::Keep() {
    if (options_.min_qual) {
        if (bcf_float_is_missing(rec_->qual) || rec_->qual < *options_.min_qual) {
            return false;
        }
    }
    if (options_.drop_filtered && rec_->d.n_flt > 0) {
        char pass[] = "PASS";
        if (bcf_has_filter(hdr_, rec_, pass) != 1) {
            return false;
        }
    }
    return true;
}

VariantPtr VcfSource::BuildVariant(uint8_t ploidy) {
    std::string id = rec_->d.id ? rec_->d.id : ".";
    if (id == ".") {
        id.clear();
    }
    std::vector<std::string> alt;
    for (uint32_t i = 1; i < rec_->n_allele; ++i) {
        std::string allele = rec_->d.allele[i];
        if (allele != ".") {
            alt.push_back(allele);
        }
    }
    uint8_t score = bcf_float_is_missing(rec_->qual) ? kMissingScore : ClipScore(rec_->qual);
    try {
        return Variant::Create(bcf_seqname(hdr_, rec_), static_cast<uint32_t>(rec_->pos + 1), id,
                               rec_->d.allele[0], alt, ploidy, score);
    } catch (const InvalidValue& e) {
        throw CorruptFile(filename_ + ": " + bcf_seqname(hdr_, rec_) + ":" + std::to_string(rec_->pos + 1) + ": " +
                          e.what());
    }
}

bool VcfSource::Next(GenotypeArray& column) {
    if (!fp_hts_) {
        throw InvalidValue("VcfSource::Next called before Open");
    }
    auto logger = LogManager::Instance().Logger();
    while (true) {
        int ret = bcf_read(fp_hts_, hdr_, rec_);
        if (ret == -1) {
            return false;
        }
        if (ret < -1) {
            throw CorruptFile("failed to parse a record of " + filename_ + " after " + std::to_string(no_read_) +
                              " records");
        }
        bcf_unpack(rec_, BCF_UN_ALL);
        if (!Keep()) {
            ++no_skipped_;
            logger->debug("Skipping {}:{}", bcf_seqname(hdr_, rec_), rec_->pos + 1);
            continue;
        }
        break;
    }

    const int n_samples = bcf_hdr_nsamples(hdr_);
    int ngt = n_samples > 0 ? bcf_get_genotypes(hdr_, rec_, &gt_arr_, &n_gt_arr_) : 0;
    int ploidy = (ngt > 0 && n_samples > 0) ? ngt / n_samples : 2;
    if (ploidy < 1 || ploidy > 255) {
        throw UnsupportedPloidy(filename_ + ": record at " + std::to_string(rec_->pos + 1) + " has ploidy " +
                                std::to_string(ploidy));
    }
    int ngq = n_samples > 0 ? bcf_get_format_int32(hdr_, rec_, "GQ", &gq_arr_, &n_gq_arr_) : 0;
    bool have_gq = ngq == n_samples && n_samples > 0;

    VariantPtr variant = BuildVariant(static_cast<uint8_t>(ploidy));
    std::vector<Genotype> genotypes;
    genotypes.reserve(n_samples);
    std::vector<int32_t> allele_idxs;
    for (int i = 0; i < n_samples; ++i) {
        allele_idxs.clear();
        if (ngt > 0) {
            const int32_t* gt = gt_arr_ + i * ploidy;
            for (int j = 0; j < ploidy; ++j) {
                if (gt[j] == bcf_int32_vector_end) {
                    break;
                }
                allele_idxs.push_back(bcf_gt_is_missing(gt[j]) ? -1 : bcf_gt_allele(gt[j]));
            }
        }
        uint8_t score = kMissingScore;
        if (have_gq && gq_arr_[i] != bcf_int32_missing && gq_arr_[i] != bcf_int32_vector_end) {
            score = ClipScore(gq_arr_[i]);
        }
        genotypes.push_back(variant->MakeGenotypeFromVcfRecord(allele_idxs, score));
    }
    column = GenotypeArray::FromGenotypes(genotypes, variant);
    ++no_read_;
    return true;
}

GenotypeTable VcfSource::ReadAll() {
    GenotypeTable table(samples_);
    GenotypeArray column;
    std::size_t idx = 0;
    while (Next(column)) {
        table.AddColumn(std::to_string(idx) + "_" + column.GetVariant()->Id(), column);
        ++idx;
    }
    LogManager::Instance().Logger()->info("Read {} variants from '{}' ({} skipped)", no_read_, filename_,
                                          no_skipped_);
    return table;
}

}  // namespace genocol
