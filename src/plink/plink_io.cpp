#include "plink_io.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <memory>
#include <sstream>
#include <thread>

#include "../errors.h"
#include "bed_codec.h"
#include "logger.h"

namespace genocol {
namespace plink {

namespace {

const std::string kAbsent = "0";
const char* const kGeneticDistance = "0";

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream ss(line);
    std::string item;
    while (ss >> item) {
        fields.push_back(item);
    }
    return fields;
}

void CheckMaxVariants(const std::optional<int64_t>& max_variants) {
    if (max_variants && *max_variants < 1) {
        throw InvalidValue("max_variants must be at least 1, got " + std::to_string(*max_variants));
    }
}

uint32_t ParseCoordinate(const std::string& text, const std::string& path, std::size_t line_no) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); }) ||
        text.size() > 10 || std::stoull(text) > kMaxPosition) {
        throw CorruptFile(path + ":" + std::to_string(line_no) + ": invalid coordinate '" + text + "'");
    }
    return static_cast<uint32_t>(std::stoull(text));
}

}  // namespace

// *****************************************************************************************************************
// FAM / BIM

SampleTable ReadFam(const std::string& path, bool categorical_phenotype) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IoError("cannot open " + path);
    }
    SampleTable samples;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::vector<std::string> fields = SplitFields(line);
        if (fields.empty()) {
            continue;
        }
        if (fields.size() != 6) {
            throw CorruptFile(path + ":" + std::to_string(line_no) + ": expected 6 fields, found " +
                              std::to_string(fields.size()));
        }
        SampleInfo info;
        info.fid = fields[0];
        info.iid = fields[1];
        info.father = fields[2];
        info.mother = fields[3];
        info.sex = ParseSex(fields[4]);
        info.phenotype = fields[5];
        if (categorical_phenotype) {
            info.status = ParseCaseControl(fields[5]);
        }
        samples.AddSample(std::move(info));
    }
    LogManager::Instance().Logger()->info("Loaded information for {} samples from '{}'", samples.size(), path);
    return samples;
}

std::vector<VariantPtr> ReadBim(const std::string& path, std::optional<int64_t> max_variants) {
    CheckMaxVariants(max_variants);
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IoError("cannot open " + path);
    }
    std::vector<VariantPtr> variants;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (max_variants && static_cast<int64_t>(variants.size()) >= *max_variants) {
            break;
        }
        std::vector<std::string> fields = SplitFields(line);
        if (fields.empty()) {
            continue;
        }
        if (fields.size() != 6) {
            throw CorruptFile(path + ":" + std::to_string(line_no) + ": expected 6 fields, found " +
                              std::to_string(fields.size()));
        }
        const std::string chromosome = fields[0] == kAbsent ? "" : fields[0];
        const uint32_t coordinate = ParseCoordinate(fields[3], path, line_no);
        const std::string& allele1 = fields[4];
        const std::string ref = fields[5] == kAbsent ? "N" : fields[5];
        std::vector<std::string> alt;
        if (allele1 != kAbsent) {
            alt.push_back(allele1);
        }
        try {
            variants.push_back(Variant::Create(chromosome, coordinate, fields[1], ref, alt, 2));
        } catch (const InvalidValue& e) {
            throw CorruptFile(path + ":" + std::to_string(line_no) + ": " + e.what());
        }
    }
    LogManager::Instance().Logger()->info("Loaded information for {} variants from '{}'", variants.size(), path);
    return variants;
}

void WriteFam(const std::string& path, const SampleTable& samples) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw IoError("cannot open " + path + " for writing");
    }
    for (const auto& s : samples.Rows()) {
        if (samples.IsStructured()) {
            out << s.fid << '\t' << s.iid << '\t' << s.father << '\t' << s.mother << '\t'
                << static_cast<int>(s.sex) << '\t' << s.phenotype << '\n';
        } else {
            if (s.iid == kAbsent) {
                throw InvalidValue("sample id '0' cannot be written to a FAM file");
            }
            out << s.iid << '\t' << s.iid << "\t0\t0\t0\t-9\n";
        }
    }
    if (!out) {
        throw IoError("failed writing " + path);
    }
}

std::string FormatBimLine(const Variant& variant) {
    if (!variant.IsBiallelic()) {
        throw UnsupportedMultiAllelic("BIM files hold biallelic variants only, " + variant.ToString() + " has " +
                                      std::to_string(variant.NumAlleles()) + " alleles");
    }
    const std::string chrom = variant.Chromosome().empty() ? kAbsent : variant.Chromosome();
    return chrom + "\t" + variant.Id() + "\t" + kGeneticDistance + "\t" + std::to_string(variant.Position()) + "\t" +
           variant.Alleles()[1] + "\t" + variant.Ref() + "\n";
}

// *****************************************************************************************************************
// PlinkReader

void PlinkReader::Open(const std::string& prefix, const ReaderOptions& options) {
    CheckMaxVariants(options.max_variants);
    prefix_ = prefix;
    options_ = options;
    samples_ = ReadFam(prefix + ".fam", options.categorical_phenotype);
    variants_ = ReadBim(prefix + ".bim", options.max_variants);
    next_variant_ = 0;

    const std::string bed_path = prefix + ".bed";
    bed_.close();
    bed_.clear();
    bed_.open(bed_path, std::ios::binary);
    if (!bed_.is_open()) {
        throw IoError("cannot open " + bed_path);
    }
    std::array<uint8_t, 3> magic{};
    bed_.read(reinterpret_cast<char*>(magic.data()), magic.size());
    if (bed_.gcount() != static_cast<std::streamsize>(magic.size()) || magic != kBedMagic) {
        throw CorruptFile(bed_path + " does not start with the PLINK BED magic bytes");
    }
    LogManager::Instance().Logger()->debug("Opened '{}' ({} samples, {} variants)", bed_path, samples_.size(),
                                           variants_.size());
}

void PlinkReader::ReadRecord(std::vector<uint8_t>& buffer) {
    const std::size_t n_bytes = BedCodec::RecordBytes(samples_.size());
    buffer.resize(n_bytes);
    bed_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(n_bytes));
    if (bed_.gcount() != static_cast<std::streamsize>(n_bytes)) {
        throw CorruptFile(prefix_ + ".bed: record " + std::to_string(next_variant_) + " is truncated (" +
                          std::to_string(bed_.gcount()) + " of " + std::to_string(n_bytes) + " bytes)");
    }
}

GenotypeArray PlinkReader::DecodeColumn(const uint8_t* bytes, std::size_t variant_idx) const {
    GenotypeArray column = BedCodec::DecodeRecord(bytes, samples_.size(), variants_[variant_idx]);
    if (options_.swap_alleles) {
        column.SetReference(1);
    }
    return column;
}

bool PlinkReader::Next(GenotypeArray& column) {
    if (!bed_.is_open()) {
        throw InvalidValue("PlinkReader::Next called before Open");
    }
    if (next_variant_ >= variants_.size()) {
        return false;
    }
    ReadRecord(buffer_);
    column = DecodeColumn(buffer_.data(), next_variant_);
    ++next_variant_;
    return true;
}

std::string PlinkReader::ColumnName(std::size_t variant_idx, const Variant& variant) {
    return std::to_string(variant_idx) + "_" + variant.Id();
}

GenotypeTable PlinkReader::ReadAll(uint32_t no_threads) {
    if (!bed_.is_open()) {
        throw InvalidValue("PlinkReader::ReadAll called before Open");
    }
    const std::size_t first = next_variant_;
    const std::size_t count = variants_.size() - first;
    const std::size_t n_bytes = BedCodec::RecordBytes(samples_.size());

    std::vector<uint8_t> body(count * n_bytes);
    for (std::size_t i = 0; i < count; ++i) {
        ReadRecord(buffer_);
        std::copy(buffer_.begin(), buffer_.end(), body.begin() + i * n_bytes);
        ++next_variant_;
    }

    std::vector<std::unique_ptr<GenotypeArray>> columns(count);
    if (no_threads < 1) {
        no_threads = 1;
    }
    if (count > 0 && no_threads > count) {
        no_threads = static_cast<uint32_t>(count);
    }
    std::vector<std::exception_ptr> errors(no_threads);
    std::vector<std::thread> workers;
    workers.reserve(no_threads);
    for (uint32_t t = 0; t < no_threads; ++t) {
        workers.emplace_back([&, t]() {
            try {
                for (std::size_t i = t; i < count; i += no_threads) {
                    columns[i] = std::make_unique<GenotypeArray>(DecodeColumn(body.data() + i * n_bytes, first + i));
                }
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    for (auto& e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }

    GenotypeTable table(samples_);
    for (std::size_t i = 0; i < count; ++i) {
        table.AddColumn(ColumnName(first + i, *variants_[first + i]), std::move(*columns[i]));
    }
    LogManager::Instance().Logger()->info("Decoded {} variants for {} samples from '{}.bed'", count,
                                          samples_.size(), prefix_);
    return table;
}

// *****************************************************************************************************************
// PlinkWriter

PlinkWriter::~PlinkWriter() {
    if (!bed_.is_open()) {
        return;
    }
    try {
        Close();
    } catch (const GenotypeError& e) {
        LogManager::Instance().Logger()->error("Closing PLINK output '{}' failed: {}", prefix_, e.what());
    }
}

void PlinkWriter::Open(const std::string& prefix, const SampleTable& samples) {
    prefix_ = prefix;
    no_samples_ = samples.size();
    no_written_ = 0;
    WriteFam(prefix + ".fam", samples);

    bim_.open(prefix + ".bim");
    if (!bim_.is_open()) {
        throw IoError("cannot open " + prefix + ".bim for writing");
    }
    bed_.open(prefix + ".bed", std::ios::binary);
    if (!bed_.is_open()) {
        throw IoError("cannot open " + prefix + ".bed for writing");
    }
    bed_.write(reinterpret_cast<const char*>(kBedMagic.data()), kBedMagic.size());
}

void PlinkWriter::Write(const GenotypeArray& column) {
    if (!bed_.is_open()) {
        throw InvalidValue("PlinkWriter::Write called before Open");
    }
    if (column.size() != no_samples_) {
        throw InvalidValue("column of " + column.GetVariant()->ToString() + " has " + std::to_string(column.size()) +
                           " rows, expected " + std::to_string(no_samples_));
    }
    std::string bim_line = FormatBimLine(*column.GetVariant());
    buffer_.clear();
    BedCodec::EncodeRecord(column, buffer_);

    bim_ << bim_line;
    bed_.write(reinterpret_cast<const char*>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
    if (!bim_ || !bed_) {
        throw IoError("failed writing variant " + column.GetVariant()->Id() + " to " + prefix_);
    }
    ++no_written_;
}

void PlinkWriter::Close() {
    if (!bed_.is_open()) {
        return;
    }
    bim_.close();
    bed_.close();
    if (bim_.fail() || bed_.fail()) {
        throw IoError("failed closing PLINK output " + prefix_);
    }
    LogManager::Instance().Logger()->info("Wrote {} variants for {} samples to '{}'", no_written_, no_samples_,
                                          prefix_);
}

// *****************************************************************************************************************

GenotypeTable ReadPlink(const std::string& prefix, const ReaderOptions& options, uint32_t no_threads) {
    PlinkReader reader;
    reader.Open(prefix, options);
    return reader.ReadAll(no_threads);
}

void WritePlink(const std::string& prefix, const GenotypeTable& table) {
    // nothing is written unless every column fits in a BED file
    for (const auto& column : table.Columns()) {
        FormatBimLine(*column.GetVariant());
        if (column.Ploidy() != 2) {
            throw UnsupportedPloidy("BED records hold diploid genotypes, " + column.GetVariant()->ToString() +
                                    " has ploidy " + std::to_string(column.Ploidy()));
        }
    }
    PlinkWriter writer;
    writer.Open(prefix, table.Samples());
    for (const auto& column : table.Columns()) {
        writer.Write(column);
    }
    writer.Close();
}

}  // namespace plink
}  // namespace genocol
