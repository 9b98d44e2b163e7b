#include "variant.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>

#include "errors.h"
#include "genotype.h"

namespace genocol {

namespace {

const std::string kMissingAllele = ".";

std::string NextVariantId() {
    static std::atomic<uint64_t> counter{0};
    return "var_" + std::to_string(counter.fetch_add(1));
}

bool ContainsDelimiter(const std::string& s) {
    return s.find(';') != std::string::npos || s.find(',') != std::string::npos;
}

std::vector<std::string> Split(const std::string& s, const std::string& sep) {
    std::vector<std::string> tokens;
    if (sep.empty()) {
        tokens.push_back(s);
        return tokens;
    }
    std::size_t start = 0;
    std::size_t pos;
    while ((pos = s.find(sep, start)) != std::string::npos) {
        tokens.push_back(s.substr(start, pos - start));
        start = pos + sep.size();
    }
    tokens.push_back(s.substr(start));
    return tokens;
}

}  // namespace

Variant::Variant(std::string chromosome, uint32_t position, std::string id, const std::string& ref,
                 const std::vector<std::string>& alt, uint8_t ploidy, uint8_t score)
    : chromosome_(std::move(chromosome)),
      position_(position),
      id_(std::move(id)),
      ploidy_(ploidy),
      score_(score) {
    if (ContainsDelimiter(chromosome_)) {
        throw InvalidValue("chromosome '" + chromosome_ + "' contains ';' or ','");
    }
    if (id_.empty()) {
        id_ = NextVariantId();
    } else if (ContainsDelimiter(id_)) {
        throw InvalidValue("variant id '" + id_ + "' contains ';' or ','");
    }
    if (position_ > kMaxPosition) {
        throw InvalidValue("position " + std::to_string(position_) + " exceeds " + std::to_string(kMaxPosition));
    }
    if (ploidy_ < 1) {
        throw InvalidValue("ploidy must be at least 1");
    }
    ValidateAllele(ref);
    alleles_.push_back(ref);
    for (const auto& a : alt) {
        ValidateAllele(a);
        if (std::find(alleles_.begin(), alleles_.end(), a) != alleles_.end()) {
            throw InvalidValue("allele '" + a + "' is listed more than once in variant " + id_);
        }
        if (alleles_.size() >= kMaxAlleles) {
            throw TooManyAlleles("variant " + id_ + " cannot hold more than " + std::to_string(kMaxAlleles) +
                                 " alleles");
        }
        alleles_.push_back(a);
    }
}

VariantPtr Variant::Create(std::string chromosome, uint32_t position, std::string id, const std::string& ref,
                           const std::vector<std::string>& alt, uint8_t ploidy, uint8_t score) {
    return std::make_shared<Variant>(std::move(chromosome), position, std::move(id), ref, alt, ploidy, score);
}

void Variant::ValidateAllele(const std::string& allele) {
    if (allele.empty() || allele == kMissingAllele) {
        throw InvalidValue("'" + allele + "' is not a valid allele");
    }
    if (ContainsDelimiter(allele)) {
        throw InvalidValue("allele '" + allele + "' contains ';' or ','");
    }
}

std::optional<uint8_t> Variant::Score() const {
    if (score_ == kMissingScore) {
        return std::nullopt;
    }
    return score_;
}

std::vector<std::string> Variant::AltAlleles() const {
    return std::vector<std::string>(alleles_.begin() + 1, alleles_.end());
}

std::string Variant::Alt() const {
    std::string out;
    for (std::size_t i = 1; i < alleles_.size(); ++i) {
        if (i > 1) {
            out += ',';
        }
        out += alleles_[i];
    }
    return out;
}

uint8_t Variant::AddAllele(const std::string& allele) {
    auto it = std::find(alleles_.begin(), alleles_.end(), allele);
    if (it != alleles_.end()) {
        return static_cast<uint8_t>(it - alleles_.begin());
    }
    ValidateAllele(allele);
    if (alleles_.size() >= kMaxAlleles) {
        throw TooManyAlleles("cannot add allele '" + allele + "' to variant " + id_ + ": limit of " +
                             std::to_string(kMaxAlleles) + " reached");
    }
    alleles_.push_back(allele);
    return static_cast<uint8_t>(alleles_.size() - 1);
}

uint8_t Variant::GetIdxFromAllele(const std::string& allele, bool add) {
    if (allele.empty() || allele == kMissingAllele) {
        return kMissingIdx;
    }
    auto it = std::find(alleles_.begin(), alleles_.end(), allele);
    if (it != alleles_.end()) {
        return static_cast<uint8_t>(it - alleles_.begin());
    }
    if (!add) {
        throw UnknownAllele("'" + allele + "' is not an allele of variant " + id_);
    }
    return AddAllele(allele);
}

const std::string& Variant::GetAlleleFromIdx(uint8_t idx) const {
    if (idx == kMissingIdx) {
        return kMissingAllele;
    }
    if (idx >= alleles_.size()) {
        throw InvalidAlleleIndex("allele index " + std::to_string(idx) + " is out of range for variant " + id_ +
                                 " with " + std::to_string(alleles_.size()) + " alleles");
    }
    return alleles_[idx];
}

bool Variant::IsValidAlleleIdx(int idx) const {
    if (idx == kMissingIdx) {
        return true;
    }
    return idx >= 0 && static_cast<std::size_t>(idx) < alleles_.size();
}

bool Variant::IsSamePosition(const Variant& other) const {
    return id_ == other.id_ && chromosome_ == other.chromosome_ && position_ == other.position_ &&
           Ref() == other.Ref() && ploidy_ == other.ploidy_;
}

bool Variant::operator==(const Variant& other) const {
    return chromosome_ == other.chromosome_ && position_ == other.position_ && id_ == other.id_ &&
           alleles_ == other.alleles_ && ploidy_ == other.ploidy_ && score_ == other.score_;
}

std::string Variant::ToString() const {
    std::ostringstream oss;
    oss << id_ << "[chr=" << (chromosome_.empty() ? kMissingAllele : chromosome_) << ";pos=" << position_
        << ";ref=" << Ref() << ";alt=" << (alleles_.size() > 1 ? Alt() : kMissingAllele) << "]";
    return oss.str();
}

VariantPtr Variant::Clone() const {
    return std::make_shared<Variant>(*this);
}

void Variant::SwapWithReference(uint8_t idx) {
    std::swap(alleles_[0], alleles_[idx]);
}

// -----------------------------------------------------------------------------
// Genotype factories

Genotype Variant::MakeGenotype(const std::vector<std::string>& alleles, bool add, uint8_t score) {
    if (alleles.size() > ploidy_) {
        throw TooManyAlleles(std::to_string(alleles.size()) + " alleles given for a variant with ploidy " +
                             std::to_string(ploidy_));
    }
    std::vector<uint8_t> idxs;
    idxs.reserve(ploidy_);
    for (const auto& a : alleles) {
        idxs.push_back(GetIdxFromAllele(a, add));
    }
    return Genotype(shared_from_this(), std::move(idxs), score);
}

Genotype Variant::MakeGenotypeFromStr(const std::string& gt_str, const std::string& sep, bool add, uint8_t score) {
    if (gt_str.empty()) {
        return Genotype(shared_from_this(), {}, score);
    }
    return MakeGenotype(Split(gt_str, sep), add, score);
}

Genotype Variant::MakeGenotypeFromPlinkBits(const std::string& code) {
    if (!IsBiallelic()) {
        throw UnsupportedMultiAllelic("PLINK genotypes require a biallelic variant, " + id_ + " has " +
                                      std::to_string(alleles_.size()) + " alleles");
    }
    if (ploidy_ != 2) {
        throw UnsupportedPloidy("PLINK genotypes require ploidy 2, variant " + id_ + " has ploidy " +
                                std::to_string(ploidy_));
    }
    std::vector<uint8_t> idxs;
    if (code == "00") {
        idxs = {0, 0};
    } else if (code == "01") {
        idxs = {kMissingIdx, kMissingIdx};
    } else if (code == "10") {
        idxs = {0, 1};
    } else if (code == "11") {
        idxs = {1, 1};
    } else {
        throw InvalidValue("'" + code + "' is not a 2-bit PLINK genotype code");
    }
    return Genotype(shared_from_this(), std::move(idxs));
}

Genotype Variant::MakeGenotypeFromVcfRecord(const std::vector<int32_t>& allele_idxs, uint8_t score) {
    if (allele_idxs.size() > ploidy_) {
        throw TooManyAlleles(std::to_string(allele_idxs.size()) + " alleles given for a variant with ploidy " +
                             std::to_string(ploidy_));
    }
    std::vector<uint8_t> idxs;
    idxs.reserve(ploidy_);
    for (int32_t a : allele_idxs) {
        if (a == -1) {
            idxs.push_back(kMissingIdx);
        } else if (a < 0 || a == kMissingIdx || !IsValidAlleleIdx(a)) {
            throw InvalidAlleleIndex("VCF allele index " + std::to_string(a) + " is invalid for variant " + id_);
        } else {
            idxs.push_back(static_cast<uint8_t>(a));
        }
    }
    return Genotype(shared_from_this(), std::move(idxs), score);
}

// -----------------------------------------------------------------------------
// Dtype strings

std::string FormatDtype(const Variant& variant) {
    std::ostringstream oss;
    oss << "genotype(" << static_cast<int>(variant.Ploidy()) << "n)["
        << (variant.Chromosome().empty() ? kMissingAllele : variant.Chromosome()) << "; " << variant.Position()
        << "; " << variant.Id() << "; " << variant.Ref() << "; "
        << (variant.NumAlleles() > 1 ? variant.Alt() : kMissingAllele) << "]";
    if (variant.Score()) {
        oss << "Q" << static_cast<int>(*variant.Score());
    }
    return oss.str();
}

namespace {

uint32_t ParseUnsigned(const std::string& text, uint64_t max_value, const std::string& dtype) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidValue("cannot parse number '" + text + "' in dtype '" + dtype + "'");
    }
    if (text.size() > 10 || std::stoull(text) > max_value) {
        throw InvalidValue("number '" + text + "' out of range in dtype '" + dtype + "'");
    }
    return static_cast<uint32_t>(std::stoull(text));
}

}  // namespace

VariantPtr ParseDtype(const std::string& dtype) {
    const std::string prefix = "genotype(";
    if (dtype.compare(0, prefix.size(), prefix) != 0) {
        throw InvalidValue("'" + dtype + "' is not a genotype dtype");
    }
    std::size_t ploidy_end = dtype.find("n)[", prefix.size());
    std::size_t body_end = dtype.rfind(']');
    if (ploidy_end == std::string::npos || body_end == std::string::npos || body_end < ploidy_end) {
        throw InvalidValue("'" + dtype + "' is not a genotype dtype");
    }
    uint32_t ploidy = ParseUnsigned(dtype.substr(prefix.size(), ploidy_end - prefix.size()), 255, dtype);

    std::vector<std::string> fields = Split(dtype.substr(ploidy_end + 3, body_end - ploidy_end - 3), "; ");
    if (fields.size() != 5) {
        throw InvalidValue("expected 5 fields in dtype '" + dtype + "', found " + std::to_string(fields.size()));
    }

    uint8_t score = kMissingScore;
    std::string suffix = dtype.substr(body_end + 1);
    if (!suffix.empty()) {
        if (suffix[0] != 'Q') {
            throw InvalidValue("unexpected suffix '" + suffix + "' in dtype '" + dtype + "'");
        }
        score = static_cast<uint8_t>(ParseUnsigned(suffix.substr(1), kMissingScore - 1, dtype));
    }

    std::string chromosome = fields[0] == kMissingAllele ? "" : fields[0];
    uint32_t position = ParseUnsigned(fields[1], kMaxPosition, dtype);
    std::vector<std::string> alt;
    if (fields[4] != kMissingAllele) {
        alt = Split(fields[4], ",");
    }
    return Variant::Create(chromosome, position, fields[2], fields[3], alt, static_cast<uint8_t>(ploidy), score);
}

}  // namespace genocol
