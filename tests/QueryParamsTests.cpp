#include <gtest/gtest.h>

#include "NetVizExceptions.h"
#include "QueryParams.h"

TEST(QueryParamsTest, Text_EmptyIsAbsent) {
    EXPECT_FALSE(QueryParams::text("").has_value());
    EXPECT_EQ(QueryParams::text("nsp"), "nsp");
}

TEST(QueryParamsTest, Integer_ParsesOrThrows) {
    EXPECT_FALSE(QueryParams::integer("", "page").has_value());
    EXPECT_EQ(QueryParams::integer("42", "page"), 42);
    EXPECT_EQ(QueryParams::integer("-3", "page"), -3);
    EXPECT_THROW(QueryParams::integer("4x", "page"), NetViz::PreconditionException);
    EXPECT_THROW(QueryParams::integer("abc", "asn"), NetViz::PreconditionException);
    EXPECT_THROW(QueryParams::integer("99999999999999999999", "asn"), NetViz::PreconditionException);
}
