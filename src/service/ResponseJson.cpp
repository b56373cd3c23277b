#include "ResponseJson.h"

#include "JsonUtils.h"

#include <sstream>

namespace {
std::string quoted(const std::string& value) {
    return "\"" + JsonUtils::escapeString(value) + "\"";
}

std::string optionalString(const std::optional<std::string>& value) {
    return value ? quoted(*value) : "null";
}

std::string optionalInteger(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "null";
}

template <typename T, typename Writer>
std::string array(const std::vector<T>& values, Writer writer) {
    std::ostringstream out;
    out << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ',';
        out << writer(values[i]);
    }
    out << ']';
    return out.str();
}
} // namespace

namespace ResponseJson {

std::string network(const NetworkRecord& record) {
    std::ostringstream out;
    out << "{"
        << "\"id\":" << record.id << ","
        << "\"name\":" << optionalString(record.name) << ","
        << "\"aka\":" << optionalString(record.aka) << ","
        << "\"asn\":" << optionalInteger(record.asn) << ","
        << "\"status\":" << optionalString(record.status) << ","
        << "\"info_type\":" << optionalString(record.infoType) << ","
        << "\"policy_general\":" << optionalString(record.policyGeneral) << ","
        << "\"info_scope\":" << optionalString(record.infoScope) << ","
        << "\"info_prefixes4\":" << optionalInteger(record.infoPrefixes4) << ","
        << "\"info_prefixes6\":" << optionalInteger(record.infoPrefixes6) << ","
        << "\"ix_count\":" << optionalInteger(record.ixCount) << ","
        << "\"fac_count\":" << optionalInteger(record.facCount) << ","
        << "\"website\":" << optionalString(record.website)
        << "}";
    return out.str();
}

std::string networks(const std::vector<NetworkRecord>& records) {
    return array(records, [](const NetworkRecord& r) { return network(r); });
}

std::string countsObject(const CategoryCounts& counts) {
    std::ostringstream out;
    out << '{';
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) out << ',';
        out << quoted(counts[i].value) << ':' << counts[i].count;
    }
    out << '}';
    return out.str();
}

std::string countsChart(const CategoryCounts& counts) {
    std::ostringstream out;
    out << "{\"labels\":" << array(counts, [](const CategoryCount& c) { return quoted(c.value); })
        << ",\"data\":" << array(counts, [](const CategoryCount& c) { return std::to_string(c.count); })
        << "}";
    return out.str();
}

std::string dashboard(const DashboardStats& stats, const std::vector<NetworkRecord>& recent) {
    std::ostringstream out;
    out << "{"
        << "\"stats\":{"
        << "\"total_networks\":" << stats.totalNetworks << ","
        << "\"network_types\":" << countsObject(stats.networkTypes) << ","
        << "\"policy_types\":" << countsObject(stats.policyTypes) << ","
        << "\"scopes\":" << countsObject(stats.scopes)
        << "},"
        << "\"networks\":" << networks(recent)
        << "}";
    return out.str();
}

std::string networkPage(const Page<NetworkRecord>& page, const NetworkCriteria& criteria) {
    std::ostringstream out;
    out << "{"
        << "\"networks\":" << networks(page.items) << ","
        << "\"page\":" << page.page << ","
        << "\"per_page\":" << page.perPage << ","
        << "\"total_pages\":" << page.totalPages << ","
        << "\"total_networks\":" << page.totalItems << ","
        << "\"q\":" << optionalString(criteria.text) << ","
        << "\"type_filter\":" << optionalString(criteria.type) << ","
        << "\"policy_filter\":" << optionalString(criteria.policy) << ","
        << "\"status_filter\":" << optionalString(criteria.status)
        << "}";
    return out.str();
}

std::string searchResults(const std::vector<NetworkRecord>& results, const SearchQuery& query) {
    std::ostringstream out;
    out << "{"
        << "\"results\":" << networks(results) << ","
        << "\"query_asn\":" << optionalInteger(query.asn) << ","
        << "\"query_name\":" << optionalString(query.name)
        << "}";
    return out.str();
}

std::string prefixDistribution(const PrefixDistribution& distribution) {
    auto integer = [](int64_t v) { return std::to_string(v); };
    std::ostringstream out;
    out << "{"
        << "\"networks\":" << array(distribution.networks, quoted) << ","
        << "\"ipv4\":" << array(distribution.ipv4, integer) << ","
        << "\"ipv6\":" << array(distribution.ipv6, integer)
        << "}";
    return out.str();
}

std::string correlation(const std::vector<CorrelationPoint>& points) {
    return array(points, [](const CorrelationPoint& p) {
        std::ostringstream out;
        out << "{\"x\":" << p.x << ",\"y\":" << p.y << ",\"label\":" << quoted(p.label) << "}";
        return out.str();
    });
}

std::string error(const std::string& message, double latencyMs) {
    std::ostringstream out;
    out << "{"
        << "\"error\":" << quoted(message) << ","
        << "\"latency_ms\":" << JsonUtils::formatDouble(latencyMs)
        << "}";
    return out.str();
}

} // namespace ResponseJson
