#pragma once

#include "NetworkRecord.h"

#include <cstddef>
#include <string>
#include <vector>

struct CategoryCount {
    std::string value;
    size_t count = 0;
};

// Ordered by first occurrence in the collection.
using CategoryCounts = std::vector<CategoryCount>;

struct DashboardStats {
    size_t totalNetworks = 0;
    CategoryCounts networkTypes;
    CategoryCounts policyTypes;
    CategoryCounts scopes;
};

class CategoryAggregator {
public:
    /**
     * @brief Frequency table of one categorical field.
     * @post Records without the field contribute nothing; entries appear in
     *       first-seen order, so identical input gives identical output.
     */
    static CategoryCounts countBy(const NetworkCollection& records, CategoryField field);

    /**
     * @brief Re-orders a table by descending count; ties keep first-seen order.
     */
    static CategoryCounts sortedByFrequency(CategoryCounts counts);

    static size_t totalCount(const CategoryCounts& counts);

    static DashboardStats summarize(const NetworkCollection& records);
};
