#pragma once

#include "NetworkRecord.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SearchQuery {
    std::optional<int64_t> asn;
    std::optional<std::string> name;
};

class SearchFilter {
public:
    static constexpr size_t kMaxNameQueryChars = 100;

    /**
     * @brief Networks whose ASN equals query.asn OR whose name contains query.name.
     * @details Name matching is case-insensitive and ignores an empty query.
     *          With neither criterion the result is empty, not the whole collection.
     * @post Result is an order-preserving subsequence of records.
     */
    static std::vector<NetworkRecord> search(const NetworkCollection& records, const SearchQuery& query);

    static bool matches(const NetworkRecord& record,
                        const std::optional<int64_t>& asn,
                        const std::optional<std::string>& nameLower);

    // Cuts to kMaxNameQueryChars code points and lowercases; nullopt for empty input.
    static std::optional<std::string> normalizeNameQuery(const std::optional<std::string>& name);
};
