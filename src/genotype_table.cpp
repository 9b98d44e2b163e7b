#include "genotype_table.h"

#include <cmath>

#include "errors.h"
#include "logger.h"

namespace genocol {

GenotypeTable::GenotypeTable(SampleTable samples) : samples_(std::move(samples)) {}

void GenotypeTable::AddColumn(const std::string& name, GenotypeArray column) {
    if (column.size() != samples_.size()) {
        throw InvalidValue("column '" + name + "' has " + std::to_string(column.size()) + " rows, the table has " +
                           std::to_string(samples_.size()) + " samples");
    }
    if (!by_name_.emplace(name, columns_.size()).second) {
        throw InvalidValue("duplicate column name '" + name + "'");
    }
    names_.push_back(name);
    columns_.push_back(std::move(column));
}

const GenotypeArray& GenotypeTable::Column(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) {
        throw InvalidValue("no column named '" + name + "'");
    }
    return columns_[it->second];
}

std::vector<VariantInfoRow> GenotypeTable::VariantInfo() const {
    std::vector<VariantInfoRow> rows;
    rows.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        const Variant& v = *columns_[i].GetVariant();
        VariantInfoRow row;
        row.column = names_[i];
        row.chromosome = v.Chromosome();
        row.position = v.Position();
        row.id = v.Id();
        row.ref = v.Ref();
        row.alt = v.Alt();
        row.ploidy = v.Ploidy();
        row.score = v.Score();
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<double> GenotypeTable::Maf() const {
    std::vector<double> out;
    out.reserve(columns_.size());
    for (const auto& c : columns_) {
        out.push_back(c.Maf());
    }
    return out;
}

std::vector<double> GenotypeTable::HwePval() const {
    std::vector<double> out;
    out.reserve(columns_.size());
    for (const auto& c : columns_) {
        out.push_back(c.HwePval());
    }
    return out;
}

GenotypeTable GenotypeTable::Subset(const std::vector<bool>& keep) const {
    GenotypeTable out(samples_);
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (keep[i]) {
            out.AddColumn(names_[i], columns_[i]);
        }
    }
    return out;
}

GenotypeTable GenotypeTable::FilterVariantsMaf(double keep_min_freq) const {
    std::vector<double> maf = Maf();
    std::vector<bool> keep(maf.size());
    for (std::size_t i = 0; i < maf.size(); ++i) {
        keep[i] = std::isnan(maf[i]) || maf[i] >= keep_min_freq;
    }
    GenotypeTable out = Subset(keep);
    LogManager::Instance().Logger()->info("MAF filter ({}): kept {} of {} variants", keep_min_freq,
                                          out.NumVariants(), NumVariants());
    return out;
}

GenotypeTable GenotypeTable::FilterVariantsHwe(double cutoff) const {
    std::vector<double> pval = HwePval();
    std::vector<bool> keep(pval.size());
    for (std::size_t i = 0; i < pval.size(); ++i) {
        keep[i] = std::isnan(pval[i]) || pval[i] >= cutoff;
    }
    GenotypeTable out = Subset(keep);
    LogManager::Instance().Logger()->info("HWE filter ({}): kept {} of {} variants", cutoff, out.NumVariants(),
                                          NumVariants());
    return out;
}

std::vector<EncodedColumn> GenotypeTable::EncodeAdditive() const {
    std::vector<EncodedColumn> out;
    out.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.push_back({names_[i], columns_[i].EncodeAdditive()});
    }
    return out;
}

std::vector<EncodedColumn> GenotypeTable::EncodeDominant() const {
    std::vector<EncodedColumn> out;
    out.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.push_back({names_[i], columns_[i].EncodeDominant()});
    }
    return out;
}

std::vector<EncodedColumn> GenotypeTable::EncodeRecessive() const {
    std::vector<EncodedColumn> out;
    out.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.push_back({names_[i], columns_[i].EncodeRecessive()});
    }
    return out;
}

std::vector<CodominantColumn> GenotypeTable::EncodeCodominant() const {
    std::vector<CodominantColumn> out;
    out.reserve(columns_.size());
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        out.push_back({names_[i], columns_[i].EncodeCodominant()});
    }
    return out;
}

WeightedEncodingResult GenotypeTable::EncodeWeighted(const std::vector<EncodingInfo>& encoding_info) const {
    auto logger = LogManager::Instance().Logger();

    std::unordered_map<std::string, const EncodingInfo*> info_by_id;
    for (const auto& info : encoding_info) {
        if (!info_by_id.emplace(info.variant_id, &info).second) {
            throw InvalidValue("encoding info lists variant '" + info.variant_id + "' more than once");
        }
    }

    WeightedEncodingResult result;
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        auto it = info_by_id.find(columns_[i].GetVariant()->Id());
        if (it == info_by_id.end()) {
            continue;
        }
        const EncodingInfo& info = *it->second;
        try {
            result.columns.push_back({names_[i], columns_[i].EncodeWeighted(info.alpha_value, info.ref_allele,
                                                                             info.alt_allele,
                                                                             info.minor_allele_freq)});
        } catch (const GenotypeError& e) {
            logger->warn("Skipping weighted encoding of '{}': {}", names_[i], e.what());
            result.skipped.push_back(names_[i]);
        }
    }
    if (!result.skipped.empty()) {
        logger->warn("{} of {} variants could not be encoded", result.skipped.size(),
                     result.skipped.size() + result.columns.size());
    }
    return result;
}

}  // namespace genocol
