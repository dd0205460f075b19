#include <gtest/gtest.h>

#include "storage/key.h"
#include "storage/record.h"

using namespace quarry;

TEST(KeyTest, EncodesAndDecodesPath) {
    Key k = Key::fromName("company", "acme").child("person", 42);
    EXPECT_EQ(k.toString(), "company:nacme/person:i42");
    EXPECT_EQ(k.kind(), "person");
    EXPECT_EQ(k.id(), 42);

    auto decoded = Key::fromString(k.toString());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, k);
}

TEST(KeyTest, EscapesSeparatorsInNames) {
    Key k = Key::fromName("doc", "a/b:c%d");
    auto decoded = Key::fromString(k.toString());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->name(), "a/b:c%d");
}

TEST(KeyTest, RejectsMalformedText) {
    EXPECT_FALSE(Key::fromString("").has_value());
    EXPECT_FALSE(Key::fromString("person").has_value());
    EXPECT_FALSE(Key::fromString("person:x1").has_value());
    EXPECT_FALSE(Key::fromString("person:i12a").has_value());
    EXPECT_FALSE(Key::fromString("person:n").has_value());
    EXPECT_FALSE(Key::fromString("person:i1/").has_value());
}

TEST(KeyTest, ParentAndAncestry) {
    Key company = Key::fromName("company", "acme");
    Key person = company.child("person", 7);
    Key other = Key::fromName("company", "globex").child("person", 7);

    ASSERT_TRUE(person.parent().has_value());
    EXPECT_EQ(*person.parent(), company);
    EXPECT_FALSE(company.parent().has_value());
    EXPECT_EQ(person.root(), company);

    EXPECT_TRUE(person.hasAncestor(company));
    EXPECT_TRUE(person.hasAncestor(person));
    EXPECT_FALSE(other.hasAncestor(company));
    EXPECT_FALSE(company.hasAncestor(person));
}

TEST(KeyTest, OrdersIdsBeforeNames) {
    Key byId = Key::fromId("person", 100);
    Key byName = Key::fromName("person", "a");
    EXPECT_TRUE(byId < byName);
    EXPECT_TRUE(Key::fromId("person", 2) < Key::fromId("person", 10));
    EXPECT_TRUE(Key::fromName("company", "acme") < Key::fromName("company", "acme").child("person", 1));
}

TEST(KeyTest, RequiresKindAndName) {
    EXPECT_THROW(Key::fromId("", 1), std::invalid_argument);
    EXPECT_THROW(Key::fromName("person", ""), std::invalid_argument);
}

TEST(RecordTest, PropertyOrderingAcrossTypes) {
    PropertyValue null = std::monostate{};
    PropertyValue one = int64_t{1};
    PropertyValue onePointFive = 1.5;
    PropertyValue yes = true;
    PropertyValue text = std::string("a");
    PropertyValue key = Key::fromId("person", 1);

    EXPECT_LT(compareProperty(null, one), 0);
    EXPECT_LT(compareProperty(one, onePointFive), 0);
    EXPECT_LT(compareProperty(onePointFive, yes), 0);
    EXPECT_LT(compareProperty(yes, text), 0);
    EXPECT_LT(compareProperty(text, key), 0);
    EXPECT_TRUE(propertyEquals(PropertyValue(int64_t{2}), PropertyValue(2.0)));
}

TEST(RecordTest, JsonPreservesBlobsAndKeys) {
    Record r;
    r.key = Key::fromName("company", "acme").child("person", 3);
    r.set("photo", Blob{{0x00, 0xFF, 0x10}});
    r.set("manager", Key::fromId("person", 1));
    r.set("name", std::string("Ada"));
    r.set("score", 9.5);
    r.set("nickname", std::monostate{});

    Record back = Record::fromJson(nlohmann::json::parse(r.toJson().dump()));
    EXPECT_EQ(back.key, r.key);
    ASSERT_EQ(back.properties.size(), r.properties.size());
    for (const auto& [name, value] : r.properties) {
        ASSERT_TRUE(back.get(name).has_value()) << name;
        EXPECT_TRUE(propertyEquals(*back.get(name), value)) << name;
    }
}
