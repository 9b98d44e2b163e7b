#pragma once

#include <cstdint>
#include <string>

#include <spdlog/spdlog.h>

#include "plink/plink_io.h"
#include "random_gt.h"

enum class task_mode_t
{
    none,
    stats,
    convert,
    import_vcf,
    simulate
};

struct Genocol_Params
{
    task_mode_t task_mode;
    std::string in_file_name;
    std::string out_file_name;
    std::string log_file_name;
    spdlog::level::level_enum log_level;

    uint32_t no_threads;

    // PLINK reading
    bool swap_alleles;
    int64_t max_variants;   // 0 reads every variant
    bool categorical_phenotype;

    // Column filters, 0 disables
    double maf_min;
    double hwe_cutoff;

    // VCF import
    double min_qual;        // negative disables
    bool drop_filtered;

    // Simulation
    uint32_t n_samples;
    uint32_t n_variants;
    double alt_freq;
    uint32_t seed;

    Genocol_Params()
    {
        task_mode = task_mode_t::none;
        in_file_name = "";
        out_file_name = "";
        log_file_name = "genocol.log";
        log_level = spdlog::level::info;
        no_threads = 1;
        swap_alleles = false;
        max_variants = 0;
        categorical_phenotype = false;
        maf_min = 0.0;
        hwe_cutoff = 0.0;
        min_qual = -1.0;
        drop_filtered = false;
        n_samples = 100;
        n_variants = 10;
        alt_freq = 0.3;
        seed = genocol::kDefaultRandomSeed;
    }
};

inline genocol::plink::ReaderOptions MakeReaderOptions(const Genocol_Params &params)
{
    genocol::plink::ReaderOptions options;
    options.swap_alleles = params.swap_alleles;
    options.categorical_phenotype = params.categorical_phenotype;
    if (params.max_variants > 0)
        options.max_variants = params.max_variants;
    return options;
}
