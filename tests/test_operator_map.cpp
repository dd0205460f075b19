#include <gtest/gtest.h>

#include "query/operator_map.h"

using namespace quarry::query;

TEST(OperatorMapTest, MapsComparisonOperators) {
    EXPECT_EQ(nativeOperatorFor(Operator::Eq), FilterOperator::Equal);
    EXPECT_EQ(nativeOperatorFor(Operator::Gt), FilterOperator::GreaterThan);
    EXPECT_EQ(nativeOperatorFor(Operator::Gte), FilterOperator::GreaterThanOrEqual);
    EXPECT_EQ(nativeOperatorFor(Operator::Lt), FilterOperator::LessThan);
    EXPECT_EQ(nativeOperatorFor(Operator::Lte), FilterOperator::LessThanOrEqual);
}

TEST(OperatorMapTest, NotEqualHasNoNativeCounterpart) {
    EXPECT_FALSE(nativeOperatorFor(Operator::Neq).has_value());
    EXPECT_FALSE(isUnsupportedOperator(Operator::Neq));
}

TEST(OperatorMapTest, RejectsArithmeticAndLogicalOperators) {
    for (Operator op : {Operator::Add, Operator::Sub, Operator::Mul, Operator::Div, Operator::Mod,
                        Operator::Concat, Operator::Neg, Operator::Not, Operator::Com, Operator::Or,
                        Operator::Between, Operator::Is, Operator::IsNot, Operator::Like}) {
        EXPECT_TRUE(isUnsupportedOperator(op)) << operatorName(op);
        EXPECT_FALSE(nativeOperatorFor(op).has_value()) << operatorName(op);
    }
}

TEST(OperatorMapTest, AndIsNeitherMappedNorRejected) {
    EXPECT_FALSE(isUnsupportedOperator(Operator::And));
    EXPECT_FALSE(nativeOperatorFor(Operator::And).has_value());
}
