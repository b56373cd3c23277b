#include "NetworkRecord.h"

#include "CommonUtils.h"

namespace RecordFields {

const std::optional<std::string>& category(const NetworkRecord& record, CategoryField field) {
    switch (field) {
        case CategoryField::INFO_TYPE: return record.infoType;
        case CategoryField::POLICY_GENERAL: return record.policyGeneral;
        case CategoryField::INFO_SCOPE: return record.infoScope;
        case CategoryField::STATUS: return record.status;
    }
    return record.infoType;
}

const std::optional<int64_t>& metric(const NetworkRecord& record, MetricField field) {
    switch (field) {
        case MetricField::ASN: return record.asn;
        case MetricField::INFO_PREFIXES4: return record.infoPrefixes4;
        case MetricField::INFO_PREFIXES6: return record.infoPrefixes6;
        case MetricField::IX_COUNT: return record.ixCount;
        case MetricField::FAC_COUNT: return record.facCount;
    }
    return record.asn;
}

const std::optional<std::string>& label(const NetworkRecord& record, LabelField field) {
    return field == LabelField::AKA ? record.aka : record.name;
}

const char* wireName(CategoryField field) {
    switch (field) {
        case CategoryField::INFO_TYPE: return "info_type";
        case CategoryField::POLICY_GENERAL: return "policy_general";
        case CategoryField::INFO_SCOPE: return "info_scope";
        case CategoryField::STATUS: return "status";
    }
    return "info_type";
}

const char* wireName(MetricField field) {
    switch (field) {
        case MetricField::ASN: return "asn";
        case MetricField::INFO_PREFIXES4: return "info_prefixes4";
        case MetricField::INFO_PREFIXES6: return "info_prefixes6";
        case MetricField::IX_COUNT: return "ix_count";
        case MetricField::FAC_COUNT: return "fac_count";
    }
    return "asn";
}

const char* wireName(LabelField field) {
    return field == LabelField::AKA ? "aka" : "name";
}

std::optional<CategoryField> parseCategoryField(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    for (CategoryField f : {CategoryField::INFO_TYPE, CategoryField::POLICY_GENERAL,
                            CategoryField::INFO_SCOPE, CategoryField::STATUS}) {
        if (key == wireName(f)) return f;
    }
    return std::nullopt;
}

std::optional<MetricField> parseMetricField(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    for (MetricField f : {MetricField::ASN, MetricField::INFO_PREFIXES4, MetricField::INFO_PREFIXES6,
                          MetricField::IX_COUNT, MetricField::FAC_COUNT}) {
        if (key == wireName(f)) return f;
    }
    return std::nullopt;
}

std::optional<LabelField> parseLabelField(const std::string& name) {
    const std::string key = CommonUtils::toLower(CommonUtils::trim(name));
    if (key == "name") return LabelField::NAME;
    if (key == "aka") return LabelField::AKA;
    return std::nullopt;
}

} // namespace RecordFields
