#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief One PeeringDB network entry.
 * @details Only id is mandatory. An unset optional means the source omitted the
 * field (or sent null); it is never the same thing as zero or "".
 */
struct NetworkRecord {
    int64_t id = 0;
    std::optional<std::string> name;
    std::optional<std::string> aka;
    std::optional<int64_t> asn;
    std::optional<std::string> status;
    std::optional<std::string> infoType;
    std::optional<std::string> policyGeneral;
    std::optional<std::string> infoScope;
    std::optional<int64_t> infoPrefixes4;
    std::optional<int64_t> infoPrefixes6;
    std::optional<int64_t> ixCount;
    std::optional<int64_t> facCount;
    std::optional<std::string> website;
};

using NetworkCollection = std::vector<NetworkRecord>;
using NetworkSnapshot = std::shared_ptr<const NetworkCollection>;

enum class CategoryField { INFO_TYPE, POLICY_GENERAL, INFO_SCOPE, STATUS };
enum class MetricField { ASN, INFO_PREFIXES4, INFO_PREFIXES6, IX_COUNT, FAC_COUNT };
enum class LabelField { NAME, AKA };

namespace RecordFields {

const std::optional<std::string>& category(const NetworkRecord& record, CategoryField field);
const std::optional<int64_t>& metric(const NetworkRecord& record, MetricField field);
const std::optional<std::string>& label(const NetworkRecord& record, LabelField field);

// Wire names match the PeeringDB JSON keys.
const char* wireName(CategoryField field);
const char* wireName(MetricField field);
const char* wireName(LabelField field);

std::optional<CategoryField> parseCategoryField(const std::string& name);
std::optional<MetricField> parseMetricField(const std::string& name);
std::optional<LabelField> parseLabelField(const std::string& name);

} // namespace RecordFields
