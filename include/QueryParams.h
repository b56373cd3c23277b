#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace QueryParams {
// Empty strings count as not provided.
std::optional<std::string> text(const std::string& raw);
/**
 * @brief Parses an optional integer parameter.
 * @throws NetViz::PreconditionException when raw is non-empty and not an integer.
 */
std::optional<int64_t> integer(const std::string& raw, const std::string& name);
}
