#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace genocol {

enum class Sex : uint8_t { Unknown = 0, Male = 1, Female = 2 };

// Categorical reading of the FAM phenotype column.
enum class CaseControl : int8_t { Missing = -1, Control = 1, Case = 2 };

struct SampleInfo {
    std::string fid;
    std::string iid;
    std::string father = "0";
    std::string mother = "0";
    Sex sex = Sex::Unknown;
    std::string phenotype = "-9";
    CaseControl status = CaseControl::Missing;
};

/**
 * @brief Sample metadata of a genotype table, one row per sample.
 *
 * Either fully structured (FAM rows) or a plain list of sample ids, in which
 * case the other FAM fields hold their PLINK defaults.
 */
class SampleTable {
public:
    SampleTable() = default;

    static SampleTable FromIds(const std::vector<std::string>& ids);

    // Throws InvalidValue when the IID is already present.
    void AddSample(SampleInfo info);

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }
    bool IsStructured() const { return structured_; }
    const SampleInfo& operator[](std::size_t i) const { return rows_[i]; }
    const std::vector<SampleInfo>& Rows() const { return rows_; }
    std::vector<std::string> Ids() const;

    bool Contains(const std::string& iid) const;
    uint32_t IndexOf(const std::string& iid) const;

private:
    std::vector<SampleInfo> rows_;
    std::unordered_map<std::string, uint32_t> which_;
    bool structured_ = true;
};

Sex ParseSex(const std::string& code);
CaseControl ParseCaseControl(const std::string& code);

}  // namespace genocol
