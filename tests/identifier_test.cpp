#include "Identifier.hpp"
#include <gtest/gtest.h>

using namespace BloxScript;

TEST(IdentifierTest, JoinsCapitalizedFragments) {
    EXPECT_EQ(sanitizeIdentifier("Get-Service"), "GetService");
    EXPECT_EQ(sanitizeIdentifier("get service list"), "GetServiceList");
    EXPECT_EQ(sanitizeIdentifier("my.var_name"), "MyVarName");
    EXPECT_EQ(sanitizeIdentifier("already Camel"), "AlreadyCamel");
}

TEST(IdentifierTest, DropsNonAlphanumerics) {
    EXPECT_EQ(sanitizeIdentifier("If / Else"), "IfElse");
    EXPECT_EQ(sanitizeIdentifier("Where (filter)"), "WhereFilter");
    EXPECT_EQ(sanitizeIdentifier("3 items"), "3Items");
}

TEST(IdentifierTest, FallsBackWhenNothingRemains) {
    EXPECT_EQ(sanitizeIdentifier(""), kFallbackIdentifier);
    EXPECT_EQ(sanitizeIdentifier("!!! ---"), kFallbackIdentifier);
}

TEST(IdentifierTest, IsDeterministic) {
    EXPECT_EQ(sanitizeIdentifier("Sort by Name"), sanitizeIdentifier("Sort by Name"));
}

TEST(IdentifierTest, AlphanumericOnly) {
    EXPECT_EQ(alphanumericOnly("ab-12_x"), "ab12x");
    EXPECT_EQ(alphanumericOnly("{3f2a-9c}"), "3f2a9c");
    EXPECT_EQ(alphanumericOnly("--"), "");
}
