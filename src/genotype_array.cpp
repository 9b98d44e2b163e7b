#include "genotype_array.h"

#include <algorithm>
#include <limits>
#include <map>
#include <set>

#include "errors.h"

namespace genocol {

const char* CodominantName(Codominant c) {
    switch (c) {
        case Codominant::Ref: return "Ref";
        case Codominant::Het: return "Het";
        case Codominant::Hom: return "Hom";
        case Codominant::Missing: return "NaN";
    }
    return "NaN";
}

// *****************************************************************************************************************
// Construction

GenotypeArray::GenotypeArray() : GenotypeArray(Variant::Create(), 0) {}

GenotypeArray::GenotypeArray(VariantPtr variant, std::size_t size) : variant_(std::move(variant)), size_(size) {
    if (!variant_) {
        throw InvalidValue("a GenotypeArray needs a variant");
    }
    records_.assign(size_ * RecordSize(), kMissingIdx);
}

GenotypeArray::GenotypeArray(VariantPtr variant, std::vector<uint8_t> records, std::size_t size)
    : variant_(std::move(variant)), records_(std::move(records)), size_(size) {}

GenotypeArray GenotypeArray::FromRawRecords(VariantPtr variant, std::vector<uint8_t> records) {
    if (!variant) {
        throw InvalidValue("a GenotypeArray needs a variant");
    }
    const std::size_t stride = static_cast<std::size_t>(variant->Ploidy()) + 1;
    if (records.size() % stride != 0) {
        throw InvalidValue("record buffer of " + std::to_string(records.size()) +
                           " bytes is not a multiple of the record size " + std::to_string(stride));
    }
    const std::size_t n = records.size() / stride;
    for (std::size_t row = 0; row < n; ++row) {
        uint8_t* rec = records.data() + row * stride;
        for (std::size_t k = 0; k < stride - 1; ++k) {
            if (!variant->IsValidAlleleIdx(rec[k])) {
                throw InvalidAlleleIndex("row " + std::to_string(row) + " holds allele index " +
                                         std::to_string(rec[k]) + ", variant " + variant->Id() + " has " +
                                         std::to_string(variant->NumAlleles()) + " alleles");
            }
        }
        std::sort(rec, rec + stride - 1);
    }
    return GenotypeArray(std::move(variant), std::move(records), n);
}

GenotypeArray GenotypeArray::FromGenotypes(const std::vector<Genotype>& genotypes, VariantPtr variant) {
    if (!variant) {
        variant = genotypes.empty() ? Variant::Create() : genotypes.front().GetVariant();
    }
    GenotypeArray out(variant, genotypes.size());
    for (std::size_t i = 0; i < genotypes.size(); ++i) {
        const Genotype& gt = genotypes[i];
        if (gt.GetVariant() != variant && !gt.GetVariant()->IsSamePosition(*variant)) {
            throw IncompatibleVariant("genotype " + std::to_string(i) + " belongs to " +
                                      gt.GetVariant()->ToString() + ", expected " + variant->ToString());
        }
        uint8_t* rec = out.MutableRow(i);
        for (std::size_t k = 0; k < gt.AlleleIdxs().size(); ++k) {
            uint8_t idx = gt.AlleleIdxs()[k];
            if (!variant->IsValidAlleleIdx(idx)) {
                throw InvalidAlleleIndex("genotype " + std::to_string(i) + " uses allele index " +
                                         std::to_string(idx) + " unknown to " + variant->ToString());
            }
            rec[k] = idx;
        }
        rec[variant->Ploidy()] = gt.RawScore();
    }
    return out;
}

GenotypeArray GenotypeArray::FromStrings(const std::vector<std::string>& genotypes, const VariantPtr& variant,
                                         const std::string& sep, bool add_alleles) {
    if (!variant) {
        throw InvalidValue("genotype strings can only be read with a variant");
    }
    std::vector<Genotype> parsed;
    parsed.reserve(genotypes.size());
    for (const auto& s : genotypes) {
        parsed.push_back(variant->MakeGenotypeFromStr(s, sep, add_alleles));
    }
    return FromGenotypes(parsed, variant);
}

GenotypeArray GenotypeArray::FromArray(const GenotypeArray& other, const VariantPtr& variant) {
    if (variant && !SameVariant(variant, other.variant_)) {
        throw IncompatibleVariant("cannot view " + other.variant_->ToString() + " as " + variant->ToString());
    }
    return GenotypeArray(other.variant_, other.records_, other.size_);
}

// *****************************************************************************************************************
// Element access

bool GenotypeArray::RowIsMissing(std::size_t row) const {
    const uint8_t* rec = AlleleIdxs(row);
    // canonical order puts missing entries last, so the first decides
    return rec[0] == kMissingIdx;
}

bool GenotypeArray::RowHasMissingAllele(std::size_t row) const {
    return AlleleIdxs(row)[Ploidy() - 1] == kMissingIdx;
}

std::size_t GenotypeArray::NormalizeIndex(int64_t i) const {
    int64_t n = static_cast<int64_t>(size_);
    int64_t pos = i < 0 ? i + n : i;
    if (pos < 0 || pos >= n) {
        throw IndexOutOfBounds("index " + std::to_string(i) + " is out of bounds for an array of size " +
                               std::to_string(size_));
    }
    return static_cast<std::size_t>(pos);
}

Genotype GenotypeArray::At(int64_t i) const {
    std::size_t row = NormalizeIndex(i);
    const uint8_t* rec = AlleleIdxs(row);
    return Genotype(variant_, std::vector<uint8_t>(rec, rec + Ploidy()), ScoreAt(row));
}

Genotype GenotypeArray::MissingValue() const {
    return Genotype(variant_);
}

void GenotypeArray::AppendRow(std::vector<uint8_t>& out, std::size_t row) const {
    const uint8_t* rec = AlleleIdxs(row);
    out.insert(out.end(), rec, rec + RecordSize());
}

GenotypeArray GenotypeArray::Slice(std::size_t start, std::size_t stop, std::size_t step) const {
    if (step == 0) {
        throw InvalidValue("slice step cannot be zero");
    }
    stop = std::min(stop, size_);
    std::vector<uint8_t> out;
    std::size_t n = 0;
    for (std::size_t row = start; row < stop; row += step) {
        AppendRow(out, row);
        ++n;
        if (stop - row <= step) {
            break;
        }
    }
    return GenotypeArray(variant_, std::move(out), n);
}

GenotypeArray GenotypeArray::Mask(const std::vector<bool>& keep) const {
    if (keep.size() != size_) {
        throw IndexOutOfBounds("boolean mask of length " + std::to_string(keep.size()) +
                               " does not match array of size " + std::to_string(size_));
    }
    std::vector<uint8_t> out;
    std::size_t n = 0;
    for (std::size_t row = 0; row < size_; ++row) {
        if (keep[row]) {
            AppendRow(out, row);
            ++n;
        }
    }
    return GenotypeArray(variant_, std::move(out), n);
}

GenotypeArray GenotypeArray::Take(const std::vector<int64_t>& indices, bool allow_fill,
                                  const Genotype* fill_value) const {
    Genotype fill = fill_value ? *fill_value : MissingValue();
    if (allow_fill && !SameVariant(fill.GetVariant(), variant_)) {
        throw IncompatibleVariant("fill value belongs to " + fill.GetVariant()->ToString());
    }
    std::vector<uint8_t> out;
    out.reserve(indices.size() * RecordSize());
    for (int64_t i : indices) {
        if (allow_fill && i < 0) {
            if (i != -1) {
                throw IndexOutOfBounds("index " + std::to_string(i) + " is invalid with allow_fill");
            }
            out.insert(out.end(), fill.AlleleIdxs().begin(), fill.AlleleIdxs().end());
            out.push_back(fill.RawScore());
        } else {
            AppendRow(out, NormalizeIndex(i));
        }
    }
    return GenotypeArray(variant_, std::move(out), indices.size());
}

GenotypeArray GenotypeArray::Copy() const {
    return GenotypeArray(variant_->Clone(), records_, size_);
}

void GenotypeArray::Set(std::size_t i, const Genotype& gt) {
    if (!SameVariant(gt.GetVariant(), variant_)) {
        throw IncompatibleVariant("cannot store a genotype of " + gt.GetVariant()->ToString() + " in a column of " +
                                  variant_->ToString());
    }
    uint8_t* rec = MutableRow(NormalizeIndex(static_cast<int64_t>(i)));
    std::copy(gt.AlleleIdxs().begin(), gt.AlleleIdxs().end(), rec);
    rec[Ploidy()] = gt.RawScore();
}

void GenotypeArray::Set(const std::vector<bool>& mask, const Genotype& gt) {
    if (mask.size() != size_) {
        throw IndexOutOfBounds("boolean mask of length " + std::to_string(mask.size()) +
                               " does not match array of size " + std::to_string(size_));
    }
    for (std::size_t row = 0; row < size_; ++row) {
        if (mask[row]) {
            Set(row, gt);
        }
    }
}

// *****************************************************************************************************************
// Row predicates

std::vector<bool> GenotypeArray::IsNa() const {
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        out[row] = RowIsMissing(row);
    }
    return out;
}

std::vector<bool> GenotypeArray::IsHomozygous() const {
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        out[row] = !RowHasMissingAllele(row) && rec[0] == rec[Ploidy() - 1];
    }
    return out;
}

std::vector<bool> GenotypeArray::IsHeterozygous() const {
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        out[row] = !RowHasMissingAllele(row) && rec[0] != rec[Ploidy() - 1];
    }
    return out;
}

std::vector<bool> GenotypeArray::IsHomozygousRef() const {
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        out[row] = rec[Ploidy() - 1] == 0;
    }
    return out;
}

std::vector<bool> GenotypeArray::IsHomozygousAlt() const {
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        out[row] = !RowHasMissingAllele(row) && rec[0] != 0 && rec[0] == rec[Ploidy() - 1];
    }
    return out;
}

std::vector<double> GenotypeArray::GtScores() const {
    std::vector<double> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        uint8_t s = ScoreAt(row);
        out[row] = s == kMissingScore ? std::numeric_limits<double>::quiet_NaN() : static_cast<double>(s);
    }
    return out;
}

std::vector<std::string> GenotypeArray::ToStrings(const std::string& sep) const {
    std::vector<std::string> out;
    out.reserve(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowIsMissing(row)) {
            out.emplace_back(".");
            continue;
        }
        const uint8_t* rec = AlleleIdxs(row);
        std::string s;
        for (std::size_t k = 0; k < Ploidy(); ++k) {
            if (k > 0) {
                s += sep;
            }
            s += variant_->GetAlleleFromIdx(rec[k]);
        }
        out.push_back(std::move(s));
    }
    return out;
}

// *****************************************************************************************************************
// Grouping

std::vector<int64_t> GenotypeArray::Factorize(GenotypeArray* uniques) const {
    std::map<std::vector<uint8_t>, int64_t> seen;
    std::vector<int64_t> codes(size_, kNaCode);
    std::vector<uint8_t> unique_records;
    for (std::size_t row = 0; row < size_; ++row) {
        if (RowIsMissing(row)) {
            continue;
        }
        const uint8_t* rec = AlleleIdxs(row);
        std::vector<uint8_t> key(rec, rec + Ploidy());
        auto it = seen.find(key);
        if (it == seen.end()) {
            it = seen.emplace(key, static_cast<int64_t>(seen.size())).first;
            unique_records.insert(unique_records.end(), key.begin(), key.end());
            unique_records.push_back(kMissingScore);
        }
        codes[row] = it->second;
    }
    if (uniques) {
        *uniques = GenotypeArray(variant_, std::move(unique_records), seen.size());
    }
    return codes;
}

GenotypeArray GenotypeArray::Unique() const {
    std::set<std::vector<uint8_t>> seen;
    std::vector<uint8_t> out;
    for (std::size_t row = 0; row < size_; ++row) {
        const uint8_t* rec = AlleleIdxs(row);
        std::vector<uint8_t> key(rec, rec + Ploidy());
        if (seen.insert(key).second) {
            out.insert(out.end(), key.begin(), key.end());
            out.push_back(kMissingScore);
        }
    }
    return GenotypeArray(variant_, std::move(out), seen.size());
}

std::vector<std::pair<Genotype, std::size_t>> GenotypeArray::ValueCounts(bool dropna) const {
    GenotypeArray uniques;
    std::vector<int64_t> codes = Factorize(&uniques);
    std::vector<std::size_t> counts(uniques.size(), 0);
    std::size_t missing = 0;
    for (int64_t code : codes) {
        if (code == kNaCode) {
            ++missing;
        } else {
            ++counts[static_cast<std::size_t>(code)];
        }
    }
    std::vector<std::pair<Genotype, std::size_t>> out;
    for (std::size_t i = 0; i < uniques.size(); ++i) {
        out.emplace_back(uniques[i], counts[i]);
    }
    if (!dropna && missing > 0) {
        out.emplace_back(MissingValue(), missing);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const std::pair<Genotype, std::size_t>& a, const std::pair<Genotype, std::size_t>& b) {
                         return a.second > b.second;
                     });
    return out;
}

GenotypeArray GenotypeArray::Concat(const std::vector<GenotypeArray>& arrays) {
    if (arrays.empty()) {
        throw InvalidValue("nothing to concatenate");
    }
    const VariantPtr& variant = arrays.front().variant_;
    std::size_t total = 0;
    for (const auto& a : arrays) {
        if (!SameVariant(a.variant_, variant)) {
            throw IncompatibleVariant("cannot concatenate " + a.variant_->ToString() + " with " +
                                      variant->ToString());
        }
        total += a.size_;
    }
    std::vector<uint8_t> out;
    out.reserve(total * arrays.front().RecordSize());
    for (const auto& a : arrays) {
        out.insert(out.end(), a.records_.begin(), a.records_.end());
    }
    return GenotypeArray(variant, std::move(out), total);
}

// *****************************************************************************************************************
// Reference allele

void GenotypeArray::SetReference(const std::string& allele) {
    SetReference(static_cast<int>(ResolveAllele(allele)));
}

void GenotypeArray::SetReference(int allele_idx) {
    if (allele_idx == kMissingIdx || !variant_->IsValidAlleleIdx(allele_idx)) {
        throw InvalidAlleleIndex("cannot use allele index " + std::to_string(allele_idx) + " as reference of " +
                                 variant_->ToString());
    }
    if (allele_idx == 0) {
        return;
    }
    // the palette is reordered below; other holders keep the old order
    if (variant_.use_count() > 1) {
        variant_ = variant_->Clone();
    }
    const uint8_t target = static_cast<uint8_t>(allele_idx);
    variant_->SwapWithReference(target);
    for (std::size_t row = 0; row < size_; ++row) {
        uint8_t* rec = MutableRow(row);
        for (std::size_t k = 0; k < Ploidy(); ++k) {
            if (rec[k] == 0) {
                rec[k] = target;
            } else if (rec[k] == target) {
                rec[k] = 0;
            }
        }
        std::sort(rec, rec + Ploidy());
    }
}

uint8_t GenotypeArray::ResolveAllele(const std::string& allele) const {
    const auto& alleles = variant_->Alleles();
    auto it = std::find(alleles.begin(), alleles.end(), allele);
    if (it == alleles.end()) {
        throw UnknownAllele("'" + allele + "' is not an allele of variant " + variant_->Id());
    }
    return static_cast<uint8_t>(it - alleles.begin());
}

// *****************************************************************************************************************
// Comparison

namespace {

bool ApplyOp(const uint8_t* a, const uint8_t* b, std::size_t n, CompareOp op) {
    int cmp = 0;
    for (std::size_t k = 0; k < n && cmp == 0; ++k) {
        if (a[k] != b[k]) {
            cmp = a[k] < b[k] ? -1 : 1;
        }
    }
    switch (op) {
        case CompareOp::Eq: return cmp == 0;
        case CompareOp::Ne: return cmp != 0;
        case CompareOp::Lt: return cmp < 0;
        case CompareOp::Le: return cmp <= 0;
        case CompareOp::Gt: return cmp > 0;
        case CompareOp::Ge: return cmp >= 0;
    }
    return false;
}

}  // namespace

std::vector<bool> GenotypeArray::Compare(const Genotype& other, CompareOp op) const {
    if (!SameVariant(other.GetVariant(), variant_)) {
        throw IncompatibleVariant("cannot compare " + variant_->ToString() + " with a genotype of " +
                                  other.GetVariant()->ToString());
    }
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        out[row] = ApplyOp(AlleleIdxs(row), other.AlleleIdxs().data(), Ploidy(), op);
    }
    return out;
}

std::vector<bool> GenotypeArray::Compare(const GenotypeArray& other, CompareOp op) const {
    if (!SameVariant(other.variant_, variant_)) {
        throw IncompatibleVariant("cannot compare " + variant_->ToString() + " with " + other.variant_->ToString());
    }
    if (other.size_ != size_) {
        throw InvalidValue("cannot compare arrays of size " + std::to_string(size_) + " and " +
                           std::to_string(other.size_));
    }
    std::vector<bool> out(size_);
    for (std::size_t row = 0; row < size_; ++row) {
        out[row] = ApplyOp(AlleleIdxs(row), other.AlleleIdxs(row), Ploidy(), op);
    }
    return out;
}

bool GenotypeArray::Equals(const GenotypeArray& other) const {
    return SameVariant(variant_, other.variant_) && records_ == other.records_;
}

}  // namespace genocol
