#pragma once

#include "NetworkRecord.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct CorrelationPoint {
    int64_t x = 0;
    int64_t y = 0;
    std::string label;
};

// Parallel arrays, one entry per charted network.
struct PrefixDistribution {
    std::vector<std::string> networks;
    std::vector<int64_t> ipv4;
    std::vector<int64_t> ipv6;
};

class CorrelationExtractor {
public:
    static constexpr size_t kDefaultChartLimit = 15;
    static constexpr size_t kDefaultLabelChars = 30;

    /**
     * @brief Projects two numeric fields of every record into (x, y, label) points.
     * @post Only records carrying both fields appear, in collection order.
     *       A missing label field yields an empty label, not an exclusion.
     */
    static std::vector<CorrelationPoint> extractPairs(const NetworkCollection& records,
                                                      MetricField fieldA,
                                                      MetricField fieldB,
                                                      LabelField labelField);

    /**
     * @brief IPv4/IPv6 prefix chart: first `limit` networks having both counts,
     *        names cut to `maxLabelChars` code points.
     */
    static PrefixDistribution prefixDistribution(const NetworkCollection& records,
                                                 size_t limit = kDefaultChartLimit,
                                                 size_t maxLabelChars = kDefaultLabelChars);

    // Appends "..." when text has more than maxChars code points.
    static std::string truncateLabel(const std::string& text, size_t maxChars);
};
