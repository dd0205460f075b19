#pragma once

#include <optional>
#include <string>
#include <vector>

namespace quarry {
namespace schema {

enum class FieldType {
    String,
    Integer,
    Double,
    Boolean,
    Decimal,
    Character,
    Bytes,
    Enum,
    Key,
    Timestamp,
    Embedded,
    // Owned one-to-one reference to a record of another class
    Relation
};

const char* fieldTypeName(FieldType type);
std::optional<FieldType> fieldTypeFromString(const std::string& name);

/// Persistent member of a class.
struct MemberMetadata {
    std::string name;
    FieldType type = FieldType::String;
    bool primaryKey = false;
    // Holds the key of the record's parent; filterable only by equality
    bool parentKey = false;
    // Store property name override
    std::optional<std::string> column;
    // Members of an embedded value, stored flattened on the owning record
    std::vector<MemberMetadata> embeddedMembers;
    // Relation members: store kind of the related class
    std::string relatedKind;
    // Relation members: the related record owns this one and is its parent
    bool relatedIsParent = false;

    bool isEmbedded() const { return type == FieldType::Embedded; }
    bool isRelation() const { return type == FieldType::Relation; }
    const std::string& propertyName() const { return column ? *column : name; }
    const MemberMetadata* embeddedMember(const std::string& memberName) const;
};

/// Persistent class and the store kind its instances are written to.
struct ClassMetadata {
    std::string typeName;
    std::string kind;
    std::vector<MemberMetadata> members;

    const MemberMetadata* member(const std::string& name) const;
    const MemberMetadata* primaryKeyMember() const;
    const MemberMetadata* parentKeyMember() const;
};

class MetadataProvider {
public:
    virtual ~MetadataProvider() = default;

    /// nullptr when the type is unknown
    virtual const ClassMetadata* metadataFor(const std::string& typeName) const = 0;
};

} // namespace schema
} // namespace quarry
