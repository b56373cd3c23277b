#include "QueryParams.h"

#include "NetVizExceptions.h"

#include <charconv>

namespace QueryParams {

std::optional<std::string> text(const std::string& raw) {
    if (raw.empty()) return std::nullopt;
    return raw;
}

std::optional<int64_t> integer(const std::string& raw, const std::string& name) {
    if (raw.empty()) return std::nullopt;
    int64_t value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    const auto result = std::from_chars(first, last, value);
    if (result.ec != std::errc() || result.ptr != last) {
        throw NetViz::PreconditionException("Query parameter '" + name + "' must be an integer: " + raw);
    }
    return value;
}

} // namespace QueryParams
