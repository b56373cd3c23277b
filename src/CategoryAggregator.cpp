#include "CategoryAggregator.h"

#include <algorithm>
#include <numeric>
#include <unordered_map>

CategoryCounts CategoryAggregator::countBy(const NetworkCollection& records, CategoryField field) {
    CategoryCounts counts;
    std::unordered_map<std::string, size_t> slotByValue;

    for (const auto& record : records) {
        const auto& value = RecordFields::category(record, field);
        if (!value) continue;

        auto it = slotByValue.find(*value);
        if (it == slotByValue.end()) {
            slotByValue.emplace(*value, counts.size());
            counts.push_back({*value, 1});
        } else {
            counts[it->second].count += 1;
        }
    }
    return counts;
}

CategoryCounts CategoryAggregator::sortedByFrequency(CategoryCounts counts) {
    std::stable_sort(counts.begin(), counts.end(), [](const CategoryCount& a, const CategoryCount& b) {
        return a.count > b.count;
    });
    return counts;
}

size_t CategoryAggregator::totalCount(const CategoryCounts& counts) {
    return std::accumulate(counts.begin(), counts.end(), size_t{0}, [](size_t acc, const CategoryCount& c) {
        return acc + c.count;
    });
}

DashboardStats CategoryAggregator::summarize(const NetworkCollection& records) {
    DashboardStats stats;
    stats.totalNetworks = records.size();
    stats.networkTypes = countBy(records, CategoryField::INFO_TYPE);
    stats.policyTypes = countBy(records, CategoryField::POLICY_GENERAL);
    stats.scopes = countBy(records, CategoryField::INFO_SCOPE);
    return stats;
}
