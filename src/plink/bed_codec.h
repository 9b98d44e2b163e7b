#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "../genotype_array.h"

namespace genocol {
namespace plink {

constexpr std::array<uint8_t, 3> kBedMagic = {0x6C, 0x1B, 0x01};

// 2-bit sample codes, values as read from the bit pair (high bit first).
enum class BedCode : uint8_t {
    HomAllele2 = 0,  // 00, homozygous reference
    Missing = 1,     // 01
    Het = 2,         // 10
    HomAllele1 = 3   // 11, homozygous alternate
};

/**
 * @brief Packs and unpacks single BED variant records.
 *
 * A record holds ceil(N/4) bytes. Sample k of a record sits in byte k/4 at
 * bits (2*(k%4)+1, 2*(k%4)), so the first sample of each byte occupies the
 * lowest bit pair. Padding bits after the last sample are zero on write and
 * ignored on read.
 */
class BedCodec {
public:
    static std::size_t RecordBytes(std::size_t n_samples) { return (n_samples + 3) / 4; }

    // Decodes one record into a diploid column bound to `variant`.
    static GenotypeArray DecodeRecord(const uint8_t* bytes, std::size_t n_samples, VariantPtr variant);

    // Appends the record of a biallelic diploid column to `out`.
    static void EncodeRecord(const GenotypeArray& column, std::vector<uint8_t>& out);

    static BedCode CodeAt(const uint8_t* bytes, std::size_t sample);
    // "00", "01", "10" or "11"
    static std::string CodeBits(BedCode code);
};

}  // namespace plink
}  // namespace genocol
