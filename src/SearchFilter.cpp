#include "SearchFilter.h"

#include "CommonUtils.h"
#include "UnicodeText.h"

std::optional<std::string> SearchFilter::normalizeNameQuery(const std::optional<std::string>& name) {
    if (!name || name->empty()) return std::nullopt;
    const size_t cut = CommonUtils::utf8PrefixBytes(*name, kMaxNameQueryChars);
    return UnicodeText::toLower(std::string_view(*name).substr(0, cut));
}

bool SearchFilter::matches(const NetworkRecord& record,
                           const std::optional<int64_t>& asn,
                           const std::optional<std::string>& nameLower) {
    if (asn && record.asn && *record.asn == *asn) {
        return true;
    }
    if (nameLower && record.name) {
        return UnicodeText::containsLowered(*record.name, *nameLower);
    }
    return false;
}

std::vector<NetworkRecord> SearchFilter::search(const NetworkCollection& records, const SearchQuery& query) {
    std::vector<NetworkRecord> results;
    const std::optional<std::string> nameLower = normalizeNameQuery(query.name);
    if (!query.asn && !nameLower) {
        return results;
    }

    for (const auto& record : records) {
        if (matches(record, query.asn, nameLower)) {
            results.push_back(record);
        }
    }
    return results;
}
