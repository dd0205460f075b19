#include <gtest/gtest.h>

#include "query/query_errors.h"
#include "query/result_shape.h"
#include "query_test_support.h"

using namespace quarry;
using namespace quarry::query;
using quarry::testing::field;
using quarry::testing::selectPeople;

namespace {

ResultShape shapeOf(std::vector<NodePtr> result) {
    auto cls = quarry::testing::personClass();
    auto compilation = selectPeople();
    compilation.result = std::move(result);
    return ResultShapeValidator(compilation, cls).validate();
}

} // namespace

TEST(ResultShapeTest, NoResultClauseMeansWholeRecords) {
    auto shape = shapeOf({});
    EXPECT_EQ(shape.kind, ResultShape::Kind::WholeRecord);
    EXPECT_TRUE(shape.projection.empty());
}

TEST(ResultShapeTest, CountWithAndWithoutAlias) {
    EXPECT_TRUE(shapeOf({makeCall("count", nullptr)}).isCount());
    EXPECT_TRUE(shapeOf({makeCall("count", nullptr, {field("this")})}).isCount());
}

TEST(ResultShapeTest, CountOfMemberIsUnsupported) {
    EXPECT_THROW(shapeOf({makeCall("count", nullptr, {field("age")})}), UnsupportedFeatureError);
    EXPECT_THROW(shapeOf({makeCall("count", nullptr, {field("this"), field("this")})}), UnsupportedFeatureError);
}

TEST(ResultShapeTest, OtherAggregatesAreUnsupportedOperators) {
    try {
        shapeOf({makeCall("max", nullptr, {field("age")})});
        FAIL() << "expected UnsupportedOperatorError";
    } catch (const UnsupportedOperatorError& e) {
        EXPECT_EQ(e.operatorName(), "max");
        EXPECT_EQ(std::string(e.what()),
                  "Problem with query <SELECT FROM Person>: The datastore does not support operator max.");
    }
}

TEST(ResultShapeTest, AliasAloneIsKeysOnly) {
    EXPECT_EQ(shapeOf({field("this")}).kind, ResultShape::Kind::KeysOnly);
}

TEST(ResultShapeTest, PrimaryKeyMemberIsKeysOnly) {
    EXPECT_EQ(shapeOf({field("id")}).kind, ResultShape::Kind::KeysOnly);
    EXPECT_EQ(shapeOf({field("this", "id")}).kind, ResultShape::Kind::KeysOnly);
}

TEST(ResultShapeTest, OrdinaryMembersAreProjected) {
    auto shape = shapeOf({field("firstName"), field("id"), field("address", "city")});
    ASSERT_EQ(shape.kind, ResultShape::Kind::FieldProjection);
    ASSERT_EQ(shape.projection.size(), 3u);
    EXPECT_EQ(shape.projection[0].propertyName, "firstName");
    EXPECT_EQ(shape.projection[1].member->name, "id");
    EXPECT_TRUE(shape.projection[2].embedded);
    EXPECT_EQ(resultShapeName(shape.kind), std::string("projection"));
}

TEST(ResultShapeTest, AggregateMixedWithRowsIsUnsupported) {
    EXPECT_THROW(shapeOf({makeCall("count", nullptr), field("firstName")}), UnsupportedFeatureError);
}

TEST(ResultShapeTest, NonMemberExpressionIsUnsupported) {
    EXPECT_THROW(shapeOf({makeLiteral(1)}), UnsupportedFeatureError);
    EXPECT_THROW(shapeOf({field("nickname")}), QueryValidationError);
}
