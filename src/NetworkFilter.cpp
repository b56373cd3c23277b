#include "NetworkFilter.h"

#include "CommonUtils.h"
#include "UnicodeText.h"

namespace {
bool provided(const std::optional<std::string>& value) {
    return value.has_value() && !value->empty();
}

bool fieldEquals(const std::optional<std::string>& field, const std::string& expected) {
    return field.has_value() && CommonUtils::equalsIgnoreCase(*field, expected);
}

bool textMatches(const NetworkRecord& record, const std::string& textLower) {
    if (record.name && UnicodeText::containsLowered(*record.name, textLower)) return true;
    if (record.asn && std::to_string(*record.asn).find(textLower) != std::string::npos) return true;
    if (record.aka && UnicodeText::containsLowered(*record.aka, textLower)) return true;
    return false;
}
} // namespace

bool NetworkCriteria::empty() const {
    return !provided(text) && !provided(type) && !provided(policy) && !provided(status);
}

bool NetworkFilter::matches(const NetworkRecord& record, const NetworkCriteria& criteria) {
    if (provided(criteria.text) && !textMatches(record, UnicodeText::toLower(*criteria.text))) return false;
    if (provided(criteria.type) && !fieldEquals(record.infoType, *criteria.type)) return false;
    if (provided(criteria.policy) && !fieldEquals(record.policyGeneral, *criteria.policy)) return false;
    if (provided(criteria.status) && !fieldEquals(record.status, *criteria.status)) return false;
    return true;
}

std::vector<NetworkRecord> NetworkFilter::apply(const NetworkCollection& records, const NetworkCriteria& criteria) {
    if (criteria.empty()) {
        return records;
    }

    std::vector<NetworkRecord> out;
    for (const auto& record : records) {
        if (matches(record, criteria)) {
            out.push_back(record);
        }
    }
    return out;
}
