#include <gtest/gtest.h>

#include "schema/schema_registry.h"
#include "query_test_support.h"

using namespace quarry;
using namespace quarry::schema;

namespace {

const char* kSchemaYaml = R"(
classes:
  - type: Person
    kind: person
    members:
      - { name: id, type: key, primary_key: true }
      - { name: company, type: key, parent_key: true }
      - { name: lastName, type: string, column: last_name }
      - { name: age, type: integer }
      - name: address
        type: embedded
        members:
          - { name: city, type: string }
  - type: Company
    members:
      - { name: name, type: string, primary_key: true }
)";

} // namespace

TEST(SchemaRegistryTest, LoadsClassesFromYaml) {
    auto registry = SchemaRegistry::fromYamlString(kSchemaYaml);
    EXPECT_EQ(registry.size(), 2u);

    const auto* person = registry.metadataFor("Person");
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->kind, "person");
    ASSERT_NE(person->primaryKeyMember(), nullptr);
    EXPECT_EQ(person->primaryKeyMember()->name, "id");
    ASSERT_NE(person->parentKeyMember(), nullptr);
    EXPECT_EQ(person->parentKeyMember()->name, "company");

    const auto* lastName = person->member("lastName");
    ASSERT_NE(lastName, nullptr);
    EXPECT_EQ(lastName->propertyName(), "last_name");
    EXPECT_EQ(person->member("age")->type, FieldType::Integer);

    const auto* address = person->member("address");
    ASSERT_NE(address, nullptr);
    EXPECT_TRUE(address->isEmbedded());
    ASSERT_NE(address->embeddedMember("city"), nullptr);

    const auto* company = registry.metadataFor("Company");
    ASSERT_NE(company, nullptr);
    EXPECT_EQ(company->kind, "Company");
}

TEST(SchemaRegistryTest, UnknownClassHasNoMetadata) {
    auto registry = quarry::testing::personRegistry();
    EXPECT_EQ(registry.metadataFor("Ghost"), nullptr);
}

TEST(SchemaRegistryTest, JsonRoundTrip) {
    auto registry = SchemaRegistry::fromYamlString(kSchemaYaml);
    auto restored = SchemaRegistry::fromJson(registry.toJson());
    EXPECT_EQ(restored.size(), 2u);
    EXPECT_EQ(restored.toJson(), registry.toJson());
    EXPECT_EQ(*restored.metadataFor("Person")->member("lastName")->column, "last_name");
}

TEST(SchemaRegistryTest, RejectsClassWithoutPrimaryKey) {
    EXPECT_THROW(SchemaRegistry::fromYamlString(R"(
classes:
  - type: Orphan
    members:
      - { name: title, type: string }
)"), SchemaError);
}

TEST(SchemaRegistryTest, RejectsNonKeyParent) {
    EXPECT_THROW(SchemaRegistry::fromYamlString(R"(
classes:
  - type: Child
    members:
      - { name: id, type: key, primary_key: true }
      - { name: owner, type: string, parent_key: true }
)"), SchemaError);
}

TEST(SchemaRegistryTest, RejectsUnknownFieldType) {
    EXPECT_THROW(SchemaRegistry::fromYamlString(R"(
classes:
  - type: Thing
    members:
      - { name: id, type: uuid, primary_key: true }
)"), SchemaError);
}

TEST(SchemaRegistryTest, RejectsEmptyEmbeddedMember) {
    ClassMetadata cls;
    cls.typeName = "Thing";
    cls.kind = "thing";
    cls.members.push_back(MemberMetadata{"id", FieldType::Key, true, false, std::nullopt, {}});
    cls.members.push_back(MemberMetadata{"box", FieldType::Embedded, false, false, std::nullopt, {}});
    SchemaRegistry registry;
    EXPECT_THROW(registry.registerClass(cls), SchemaError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SchemaRegistryTest, MalformedYamlIsSchemaError) {
    EXPECT_THROW(SchemaRegistry::fromYamlString("classes: [unclosed"), SchemaError);
    EXPECT_THROW(SchemaRegistry::loadFromYaml("/nonexistent/schema.yaml"), SchemaError);
}

TEST(SchemaRegistryTest, LoadsRelationMembers) {
    auto registry = SchemaRegistry::fromYamlString(R"(
classes:
  - type: Badge
    kind: badge
    members:
      - { name: id, type: key, primary_key: true }
      - { name: holder, type: relation, related_kind: person, related_is_parent: true }
)");
    const auto* holder = registry.metadataFor("Badge")->member("holder");
    ASSERT_NE(holder, nullptr);
    EXPECT_TRUE(holder->isRelation());
    EXPECT_EQ(holder->relatedKind, "person");
    EXPECT_TRUE(holder->relatedIsParent);

    auto reloaded = SchemaRegistry::fromJson(registry.toJson());
    EXPECT_EQ(reloaded.metadataFor("Badge")->member("holder")->relatedKind, "person");
}

TEST(SchemaRegistryTest, RelationWithoutRelatedKindIsRejected) {
    EXPECT_THROW(SchemaRegistry::fromYamlString(R"(
classes:
  - type: Badge
    members:
      - { name: id, type: key, primary_key: true }
      - { name: holder, type: relation }
)"), SchemaError);
}
