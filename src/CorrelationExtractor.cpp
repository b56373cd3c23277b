#include "CorrelationExtractor.h"

#include "CommonUtils.h"

#include <algorithm>

std::vector<CorrelationPoint> CorrelationExtractor::extractPairs(const NetworkCollection& records,
                                                                 MetricField fieldA,
                                                                 MetricField fieldB,
                                                                 LabelField labelField) {
    std::vector<CorrelationPoint> points;
    for (const auto& record : records) {
        const auto& a = RecordFields::metric(record, fieldA);
        const auto& b = RecordFields::metric(record, fieldB);
        if (!a || !b) continue;

        const auto& label = RecordFields::label(record, labelField);
        points.push_back({*a, *b, label.value_or(std::string())});
    }
    return points;
}

PrefixDistribution CorrelationExtractor::prefixDistribution(const NetworkCollection& records,
                                                            size_t limit,
                                                            size_t maxLabelChars) {
    PrefixDistribution out;
    const std::vector<CorrelationPoint> points =
        extractPairs(records, MetricField::INFO_PREFIXES4, MetricField::INFO_PREFIXES6, LabelField::NAME);

    const size_t n = std::min(limit, points.size());
    out.networks.reserve(n);
    out.ipv4.reserve(n);
    out.ipv6.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.networks.push_back(truncateLabel(points[i].label, maxLabelChars));
        out.ipv4.push_back(points[i].x);
        out.ipv6.push_back(points[i].y);
    }
    return out;
}

std::string CorrelationExtractor::truncateLabel(const std::string& text, size_t maxChars) {
    const size_t cut = CommonUtils::utf8PrefixBytes(text, maxChars);
    if (cut >= text.size()) return text;
    return text.substr(0, cut) + "...";
}
