#pragma once

#include "NetworkRecord.h"

#include <cstdint>
#include <optional>
#include <string>

namespace TestRecords {

inline NetworkRecord make(int64_t id,
                          std::optional<std::string> name = std::nullopt,
                          std::optional<int64_t> asn = std::nullopt) {
    NetworkRecord r;
    r.id = id;
    r.name = std::move(name);
    r.asn = asn;
    return r;
}

inline NetworkRecord withType(NetworkRecord r, std::optional<std::string> type) {
    r.infoType = std::move(type);
    return r;
}

inline NetworkRecord withCounts(NetworkRecord r, std::optional<int64_t> ix, std::optional<int64_t> fac) {
    r.ixCount = ix;
    r.facCount = fac;
    return r;
}

inline NetworkRecord withPrefixes(NetworkRecord r, std::optional<int64_t> v4, std::optional<int64_t> v6) {
    r.infoPrefixes4 = v4;
    r.infoPrefixes6 = v6;
    return r;
}

} // namespace TestRecords
