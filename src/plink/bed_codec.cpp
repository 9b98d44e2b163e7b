#include "bed_codec.h"

#include "../errors.h"

namespace genocol {
namespace plink {

namespace {

// Allele index pairs for each code, in code order.
constexpr uint8_t kCodeAlleles[4][2] = {
    {0, 0},
    {kMissingIdx, kMissingIdx},
    {0, 1},
    {1, 1},
};

// codes_lut[byte][j] is the code of the j-th sample stored in `byte`.
struct CodeTable {
    uint8_t codes_lut[256][4];

    CodeTable() {
        for (int byte = 0; byte < 256; ++byte) {
            for (int j = 0; j < 4; ++j) {
                codes_lut[byte][j] = static_cast<uint8_t>((byte >> (2 * j)) & 0x3);
            }
        }
    }
};

const CodeTable& Codes() {
    static const CodeTable table;
    return table;
}

BedCode CodeForRow(const uint8_t* allele_idxs) {
    // rows are sorted, so missing alleles come last
    if (allele_idxs[1] == kMissingIdx) {
        return BedCode::Missing;
    }
    if (allele_idxs[0] == 0 && allele_idxs[1] == 0) {
        return BedCode::HomAllele2;
    }
    if (allele_idxs[0] == 1 && allele_idxs[1] == 1) {
        return BedCode::HomAllele1;
    }
    return BedCode::Het;
}

}  // namespace

BedCode BedCodec::CodeAt(const uint8_t* bytes, std::size_t sample) {
    return static_cast<BedCode>(Codes().codes_lut[bytes[sample / 4]][sample % 4]);
}

std::string BedCodec::CodeBits(BedCode code) {
    switch (code) {
        case BedCode::HomAllele2: return "00";
        case BedCode::Missing: return "01";
        case BedCode::Het: return "10";
        case BedCode::HomAllele1: return "11";
    }
    return "01";
}

GenotypeArray BedCodec::DecodeRecord(const uint8_t* bytes, std::size_t n_samples, VariantPtr variant) {
    if (variant->Ploidy() != 2) {
        throw UnsupportedPloidy("BED records hold diploid genotypes, " + variant->ToString() + " has ploidy " +
                                std::to_string(variant->Ploidy()));
    }
    const auto& lut = Codes().codes_lut;
    std::vector<uint8_t> records(n_samples * 3);
    uint8_t* out = records.data();
    for (std::size_t k = 0; k < n_samples; ++k, out += 3) {
        const uint8_t* alleles = kCodeAlleles[lut[bytes[k >> 2]][k & 3]];
        out[0] = alleles[0];
        out[1] = alleles[1];
        out[2] = kMissingScore;
    }
    return GenotypeArray::FromRawRecords(std::move(variant), std::move(records));
}

void BedCodec::EncodeRecord(const GenotypeArray& column, std::vector<uint8_t>& out) {
    const Variant& variant = *column.GetVariant();
    if (!variant.IsBiallelic()) {
        throw UnsupportedMultiAllelic("BED records need biallelic variants, " + variant.ToString() + " has " +
                                      std::to_string(variant.NumAlleles()) + " alleles");
    }
    if (variant.Ploidy() != 2) {
        throw UnsupportedPloidy("BED records hold diploid genotypes, " + variant.ToString() + " has ploidy " +
                                std::to_string(variant.Ploidy()));
    }
    const std::size_t start = out.size();
    out.resize(start + RecordBytes(column.size()), 0);
    uint8_t* bytes = out.data() + start;
    for (std::size_t k = 0; k < column.size(); ++k) {
        const uint8_t code = static_cast<uint8_t>(CodeForRow(column.AlleleIdxs(k)));
        bytes[k >> 2] |= static_cast<uint8_t>(code << (2 * (k & 3)));
    }
}

}  // namespace plink
}  // namespace genocol
