#include "samples.h"

#include "errors.h"

namespace genocol {

// *****************************************************************************************************************
SampleTable SampleTable::FromIds(const std::vector<std::string>& ids) {
    SampleTable table;
    table.structured_ = false;
    for (const auto& id : ids) {
        SampleInfo info;
        info.fid = id;
        info.iid = id;
        table.AddSample(std::move(info));
    }
    return table;
}

// *****************************************************************************************************************
void SampleTable::AddSample(SampleInfo info) {
    if (!which_.emplace(info.iid, static_cast<uint32_t>(rows_.size())).second) {
        throw InvalidValue("two samples with the same id '" + info.iid + "'");
    }
    rows_.push_back(std::move(info));
}

// *****************************************************************************************************************
std::vector<std::string> SampleTable::Ids() const {
    std::vector<std::string> ids;
    ids.reserve(rows_.size());
    for (const auto& row : rows_) {
        ids.push_back(row.iid);
    }
    return ids;
}

// *****************************************************************************************************************
bool SampleTable::Contains(const std::string& iid) const {
    return which_.count(iid) != 0;
}

uint32_t SampleTable::IndexOf(const std::string& iid) const {
    auto it = which_.find(iid);
    if (it == which_.end()) {
        throw InvalidValue("there is no sample " + iid + " in the set");
    }
    return it->second;
}

// *****************************************************************************************************************
Sex ParseSex(const std::string& code) {
    if (code == "1") {
        return Sex::Male;
    }
    if (code == "2") {
        return Sex::Female;
    }
    return Sex::Unknown;
}

CaseControl ParseCaseControl(const std::string& code) {
    if (code == "1") {
        return CaseControl::Control;
    }
    if (code == "2") {
        return CaseControl::Case;
    }
    return CaseControl::Missing;
}

}  // namespace genocol
