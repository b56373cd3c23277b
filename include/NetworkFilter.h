#pragma once

#include "NetworkRecord.h"

#include <optional>
#include <string>
#include <vector>

// Listing filters; an empty string counts as not provided.
struct NetworkCriteria {
    std::optional<std::string> text;
    std::optional<std::string> type;
    std::optional<std::string> policy;
    std::optional<std::string> status;

    bool empty() const;
};

class NetworkFilter {
public:
    /**
     * @brief All records satisfying every provided criterion, in collection order.
     * @details text matches name or aka (case-insensitive) or the decimal ASN;
     *          type/policy/status compare case-insensitively against info_type,
     *          policy_general and status. No criteria returns everything.
     */
    static std::vector<NetworkRecord> apply(const NetworkCollection& records, const NetworkCriteria& criteria);

    static bool matches(const NetworkRecord& record, const NetworkCriteria& criteria);
};
