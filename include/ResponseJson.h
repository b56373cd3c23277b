#pragma once

#include "CategoryAggregator.h"
#include "CorrelationExtractor.h"
#include "NetworkFilter.h"
#include "NetworkRecord.h"
#include "Paginator.h"
#include "SearchFilter.h"

#include <string>
#include <vector>

// JSON payloads served by the API. Absent optional fields are written as null.
namespace ResponseJson {

std::string network(const NetworkRecord& record);
std::string networks(const std::vector<NetworkRecord>& records);

// {"Content":5,"NSP":2} in first-seen order.
std::string countsObject(const CategoryCounts& counts);
// {"labels":[...],"data":[...]} for chart widgets.
std::string countsChart(const CategoryCounts& counts);

std::string dashboard(const DashboardStats& stats, const std::vector<NetworkRecord>& recent);
std::string networkPage(const Page<NetworkRecord>& page, const NetworkCriteria& criteria);
std::string searchResults(const std::vector<NetworkRecord>& results, const SearchQuery& query);
std::string prefixDistribution(const PrefixDistribution& distribution);
std::string correlation(const std::vector<CorrelationPoint>& points);
std::string error(const std::string& message, double latencyMs);

} // namespace ResponseJson
