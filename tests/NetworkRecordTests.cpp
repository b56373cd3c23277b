#include <gtest/gtest.h>

#include "NetworkRecord.h"
#include "TestRecords.h"

TEST(NetworkRecordTest, Accessors_ReturnTheSelectedField) {
    NetworkRecord r = TestRecords::make(1, "Name", 64500);
    r.aka = "Aka";
    r.status = "ok";
    r.ixCount = 3;

    EXPECT_EQ(RecordFields::category(r, CategoryField::STATUS), "ok");
    EXPECT_FALSE(RecordFields::category(r, CategoryField::INFO_TYPE).has_value());
    EXPECT_EQ(RecordFields::metric(r, MetricField::ASN), 64500);
    EXPECT_EQ(RecordFields::metric(r, MetricField::IX_COUNT), 3);
    EXPECT_EQ(RecordFields::label(r, LabelField::AKA), "Aka");
    EXPECT_EQ(RecordFields::label(r, LabelField::NAME), "Name");
}

TEST(NetworkRecordTest, ParseFieldNames_AcceptWireNames) {
    EXPECT_EQ(RecordFields::parseCategoryField("policy_general"), CategoryField::POLICY_GENERAL);
    EXPECT_EQ(RecordFields::parseCategoryField(" Info_Scope "), CategoryField::INFO_SCOPE);
    EXPECT_FALSE(RecordFields::parseCategoryField("asn").has_value());

    EXPECT_EQ(RecordFields::parseMetricField("fac_count"), MetricField::FAC_COUNT);
    EXPECT_EQ(RecordFields::parseMetricField("info_prefixes6"), MetricField::INFO_PREFIXES6);
    EXPECT_FALSE(RecordFields::parseMetricField("name").has_value());

    EXPECT_EQ(RecordFields::parseLabelField("aka"), LabelField::AKA);
    EXPECT_FALSE(RecordFields::parseLabelField("").has_value());
}

TEST(NetworkRecordTest, WireName_RoundTripsThroughParser) {
    for (CategoryField f : {CategoryField::INFO_TYPE, CategoryField::POLICY_GENERAL,
                            CategoryField::INFO_SCOPE, CategoryField::STATUS}) {
        EXPECT_EQ(RecordFields::parseCategoryField(RecordFields::wireName(f)), f);
    }
    EXPECT_STREQ(RecordFields::wireName(MetricField::IX_COUNT), "ix_count");
    EXPECT_STREQ(RecordFields::wireName(LabelField::NAME), "name");
}
