#include <cstdlib>
#include <cstring>
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "errors.h"
#include "genotype_table.h"
#include "logger.h"
#include "params.h"
#include "plink/plink_io.h"
#include "random_gt.h"
#include "vcf/vcf_source.h"

using namespace std;
using namespace std::chrono;
using namespace genocol;

int usage();
int usage_stats();
int usage_convert();
int usage_import_vcf();
int usage_simulate();
int params_options(int argc, const char *argv[]);
int stats_entry();
int convert_entry();
int import_vcf_entry();
int simulate_entry();

//--------------------------------------------------------------------------------
Genocol_Params params;

int usage()
{
    auto logger = LogManager::Instance().Logger();
    logger->info("Usage: genocol [option] [arguments]");
    logger->info("Available options:");
    logger->info("\tstats - per-variant MAF and HWE p-value of a PLINK fileset");
    logger->info("\tconvert - rewrite a PLINK fileset with optional allele swap and filters");
    logger->info("\timport-vcf - convert a VCF/BCF file to a PLINK fileset");
    logger->info("\tsimulate - write a random biallelic PLINK fileset");
    logger->info("Global options: --log-level [trace|debug|info|warn|error], --log-file [file]");
    return 0;
}

int usage_stats()
{
    auto logger = LogManager::Instance().Logger();
    logger->info(R"(Usage of genocol stats:

    genocol stats --in [prefix] [--out [file]]

Where:
    -i,  --in [prefix]       PLINK fileset prefix (reads prefix.bed, prefix.bim, prefix.fam).
    -o,  --out [file]        Write the table to [file] (default: standard output).

Options:
    -t,  --threads [X]       Decode variants with [X] threads (default: 1).
    -n,  --max-variants [X]  Read at most [X] variants (0: all).
    --swap-alleles           Treat allele1 of the BIM file as reference.
)");
    return 0;
}

int usage_convert()
{
    auto logger = LogManager::Instance().Logger();
    logger->info(R"(Usage of genocol convert:

    genocol convert --in [prefix] --out [prefix] [options]

Where:
    -i,  --in [prefix]       Input PLINK fileset prefix.
    -o,  --out [prefix]      Output PLINK fileset prefix.

Options:
    -t,  --threads [X]       Decode variants with [X] threads (default: 1).
    -n,  --max-variants [X]  Read at most [X] variants (0: all).
    --swap-alleles           Treat allele1 of the BIM file as reference.
    --categorical            Read the FAM phenotype as 1 = control, 2 = case.
    --maf [X]                Keep variants with minor allele frequency >= X.
    --hwe [X]                Drop variants with HWE p-value < X.
)");
    return 0;
}

int usage_import_vcf()
{
    auto logger = LogManager::Instance().Logger();
    logger->info(R"(Usage of genocol import-vcf:

    genocol import-vcf --in [file] --out [prefix] [options]

Where:
    -i,  --in [file]         VCF, VCF.GZ or BCF input.
    -o,  --out [prefix]      Output PLINK fileset prefix.

Options:
    --min-qual [X]           Skip records with QUAL < X or missing QUAL.
    --pass-only              Skip records whose FILTER is not PASS.

Records that are not biallelic are skipped.
)");
    return 0;
}

int usage_simulate()
{
    auto logger = LogManager::Instance().Logger();
    logger->info(R"(Usage of genocol simulate:

    genocol simulate --out [prefix] [options]

Options:
    -n,  --samples [X]       Number of samples (default: 100).
    -m,  --variants [X]      Number of variants (default: 10).
    --freq [X]               Alternate allele frequency (default: 0.3).
    --seed [X]               Random seed (default: 1855).
)");
    return 0;
}

int main(int argc, const char *argv[])
{
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "--log-file") == 0)
            params.log_file_name = argv[i + 1];
    }
    LogManager::Instance().Initialize(params.log_file_name);
    auto logger = LogManager::Instance().Logger();

    high_resolution_clock::time_point start = high_resolution_clock::now();
    int result = 0;

    if (!params_options(argc, argv))
        return 1;
    LogManager::Instance().SetLevel(params.log_level);

    try {
        if (params.task_mode == task_mode_t::stats)
            result = stats_entry();
        else if (params.task_mode == task_mode_t::convert)
            result = convert_entry();
        else if (params.task_mode == task_mode_t::import_vcf)
            result = import_vcf_entry();
        else if (params.task_mode == task_mode_t::simulate)
            result = simulate_entry();
    } catch (const GenotypeError &e) {
        logger->error("{}", e.what());
        result = 1;
    }
    if (result)
        logger->error("genocol failed.");

    high_resolution_clock::time_point end = high_resolution_clock::now();
    duration<double> time_duration = duration_cast<duration<double>>(end - start);
    logger->info("Total processing time: {:.3f} seconds.", time_duration.count());
    return result;
}

// Returns 1 when parameters are complete, 0 after printing usage.
int params_options(int argc, const char *argv[])
{
    auto logger = LogManager::Instance().Logger();
    int (*usage_task)() = usage;

    if (argc < 2) {
        usage();
        return 0;
    }
    if (string(argv[1]) == "stats") {
        params.task_mode = task_mode_t::stats;
        usage_task = usage_stats;
    } else if (string(argv[1]) == "convert") {
        params.task_mode = task_mode_t::convert;
        usage_task = usage_convert;
    } else if (string(argv[1]) == "import-vcf") {
        params.task_mode = task_mode_t::import_vcf;
        usage_task = usage_import_vcf;
    } else if (string(argv[1]) == "simulate") {
        params.task_mode = task_mode_t::simulate;
        usage_task = usage_simulate;
    } else {
        usage();
        return 0;
    }

    for (int i = 2; i < argc; ++i) {
        if (argv[i][0] != '-') {
            usage_task();
            return 0;
        }
        // options that take a value
        bool has_value = i + 1 < argc;
        if (strcmp(argv[i], "--in") == 0 || strcmp(argv[i], "-i") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.in_file_name = argv[++i];
        } else if (strcmp(argv[i], "--out") == 0 || strcmp(argv[i], "-o") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.out_file_name = argv[++i];
        } else if (strcmp(argv[i], "--log-file") == 0) {
            ++i;
        } else if (strcmp(argv[i], "--log-level") == 0) {
            if (!has_value || !LogManager::ParseLevel(argv[i + 1], params.log_level)) {
                logger->error("Unknown log level.");
                usage();
                return 0;
            }
            ++i;
        } else if (strcmp(argv[i], "--threads") == 0 || strcmp(argv[i], "-t") == 0) {
            if (!has_value) { usage_task(); return 0; }
            int temp = atoi(argv[++i]);
            if (temp < 1) { usage_task(); return 0; }
            params.no_threads = temp;
        } else if ((strcmp(argv[i], "--max-variants") == 0 || strcmp(argv[i], "-n") == 0) &&
                   params.task_mode != task_mode_t::simulate) {
            if (!has_value) { usage_task(); return 0; }
            params.max_variants = atoll(argv[++i]);
            if (params.max_variants < 0) {
                logger->error("--max-variants cannot be negative.");
                return 0;
            }
        } else if (strcmp(argv[i], "--swap-alleles") == 0) {
            params.swap_alleles = true;
        } else if (strcmp(argv[i], "--categorical") == 0) {
            params.categorical_phenotype = true;
        } else if (strcmp(argv[i], "--maf") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.maf_min = atof(argv[++i]);
        } else if (strcmp(argv[i], "--hwe") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.hwe_cutoff = atof(argv[++i]);
        } else if (strcmp(argv[i], "--min-qual") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.min_qual = atof(argv[++i]);
        } else if (strcmp(argv[i], "--pass-only") == 0) {
            params.drop_filtered = true;
        } else if (strcmp(argv[i], "--samples") == 0 || strcmp(argv[i], "-n") == 0) {
            if (!has_value) { usage_task(); return 0; }
            int temp = atoi(argv[++i]);
            if (temp < 1) { usage_task(); return 0; }
            params.n_samples = temp;
        } else if (strcmp(argv[i], "--variants") == 0 || strcmp(argv[i], "-m") == 0) {
            if (!has_value) { usage_task(); return 0; }
            int temp = atoi(argv[++i]);
            if (temp < 1) { usage_task(); return 0; }
            params.n_variants = temp;
        } else if (strcmp(argv[i], "--freq") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.alt_freq = atof(argv[++i]);
            if (params.alt_freq < 0.0 || params.alt_freq > 1.0) {
                logger->error("--freq must be between 0 and 1.");
                return 0;
            }
        } else if (strcmp(argv[i], "--seed") == 0) {
            if (!has_value) { usage_task(); return 0; }
            params.seed = static_cast<uint32_t>(strtoul(argv[++i], nullptr, 10));
        } else {
            logger->error("Unknown option: {}", argv[i]);
            usage_task();
            return 0;
        }
    }

    if (params.task_mode != task_mode_t::simulate && params.in_file_name.empty()) {
        logger->error("Error: no input specified!");
        usage_task();
        return 0;
    }
    if (params.task_mode != task_mode_t::stats && params.out_file_name.empty()) {
        logger->error("Error: no output prefix specified!");
        usage_task();
        return 0;
    }
    return 1;
}

int stats_entry()
{
    GenotypeTable table = plink::ReadPlink(params.in_file_name, MakeReaderOptions(params), params.no_threads);

    ofstream out_file;
    if (!params.out_file_name.empty()) {
        out_file.open(params.out_file_name);
        if (!out_file.is_open())
            throw IoError("cannot open " + params.out_file_name + " for writing");
    }
    ostream &out = params.out_file_name.empty() ? cout : out_file;

    vector<VariantInfoRow> info = table.VariantInfo();
    vector<double> maf = table.Maf();
    vector<double> hwe = table.HwePval();
    out << "column\tchromosome\tposition\tid\tref\talt\tmaf\thwe_p\n";
    for (size_t i = 0; i < info.size(); ++i) {
        out << info[i].column << '\t' << (info[i].chromosome.empty() ? "." : info[i].chromosome) << '\t'
            << info[i].position << '\t' << info[i].id << '\t' << info[i].ref << '\t'
            << (info[i].alt.empty() ? "." : info[i].alt) << '\t' << maf[i] << '\t' << hwe[i] << '\n';
    }
    if (!out)
        throw IoError("failed writing statistics");
    return 0;
}

int convert_entry()
{
    GenotypeTable table = plink::ReadPlink(params.in_file_name, MakeReaderOptions(params), params.no_threads);
    if (params.maf_min > 0.0)
        table = table.FilterVariantsMaf(params.maf_min);
    if (params.hwe_cutoff > 0.0)
        table = table.FilterVariantsHwe(params.hwe_cutoff);
    plink::WritePlink(params.out_file_name, table);
    return 0;
}

int import_vcf_entry()
{
    auto logger = LogManager::Instance().Logger();
    VcfSourceOptions options;
    if (params.min_qual >= 0.0)
        options.min_qual = params.min_qual;
    options.drop_filtered = params.drop_filtered;

    VcfSource source(options);
    source.Open(params.in_file_name);

    plink::PlinkWriter writer;
    writer.Open(params.out_file_name, source.Samples());
    GenotypeArray column;
    uint64_t not_biallelic = 0;
    while (source.Next(column)) {
        if (!column.GetVariant()->IsBiallelic() || column.Ploidy() != 2) {
            logger->debug("Skipping {}: not a biallelic diploid site", column.GetVariant()->ToString());
            ++not_biallelic;
            continue;
        }
        writer.Write(column);
    }
    writer.Close();
    if (not_biallelic)
        logger->warn("{} records were not biallelic diploid sites and were skipped.", not_biallelic);
    return 0;
}

int simulate_entry()
{
    vector<string> ids;
    for (uint32_t i = 0; i < params.n_samples; ++i)
        ids.push_back("sample_" + to_string(i + 1));

    plink::PlinkWriter writer;
    writer.Open(params.out_file_name, SampleTable::FromIds(ids));
    for (uint32_t j = 0; j < params.n_variants; ++j) {
        VariantPtr variant = Variant::Create("1", j + 1, "sim_" + to_string(j + 1), "A", {"T"});
        writer.Write(GenerateRandomGt(variant, {1.0 - params.alt_freq, params.alt_freq}, params.n_samples,
                                      params.seed + j));
    }
    writer.Close();
    return 0;
}
