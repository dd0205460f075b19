#include "schema/metadata.h"

#include <algorithm>
#include <cctype>

namespace quarry {
namespace schema {

const char* fieldTypeName(FieldType type) {
    switch (type) {
        case FieldType::String: return "string";
        case FieldType::Integer: return "integer";
        case FieldType::Double: return "double";
        case FieldType::Boolean: return "boolean";
        case FieldType::Decimal: return "decimal";
        case FieldType::Character: return "char";
        case FieldType::Bytes: return "bytes";
        case FieldType::Enum: return "enum";
        case FieldType::Key: return "key";
        case FieldType::Timestamp: return "timestamp";
        case FieldType::Embedded: return "embedded";
        case FieldType::Relation: return "relation";
    }
    return "string";
}

std::optional<FieldType> fieldTypeFromString(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "string") return FieldType::String;
    if (s == "integer" || s == "int" || s == "long") return FieldType::Integer;
    if (s == "double" || s == "float") return FieldType::Double;
    if (s == "boolean" || s == "bool") return FieldType::Boolean;
    if (s == "decimal") return FieldType::Decimal;
    if (s == "char" || s == "character") return FieldType::Character;
    if (s == "bytes" || s == "blob") return FieldType::Bytes;
    if (s == "enum") return FieldType::Enum;
    if (s == "key") return FieldType::Key;
    if (s == "timestamp" || s == "date") return FieldType::Timestamp;
    if (s == "embedded") return FieldType::Embedded;
    if (s == "relation" || s == "one_to_one") return FieldType::Relation;
    return std::nullopt;
}

const MemberMetadata* MemberMetadata::embeddedMember(const std::string& memberName) const {
    for (const auto& m : embeddedMembers) {
        if (m.name == memberName) return &m;
    }
    return nullptr;
}

const MemberMetadata* ClassMetadata::member(const std::string& name) const {
    for (const auto& m : members) {
        if (m.name == name) return &m;
    }
    return nullptr;
}

const MemberMetadata* ClassMetadata::primaryKeyMember() const {
    for (const auto& m : members) {
        if (m.primaryKey) return &m;
    }
    return nullptr;
}

const MemberMetadata* ClassMetadata::parentKeyMember() const {
    for (const auto& m : members) {
        if (m.parentKey) return &m;
    }
    return nullptr;
}

} // namespace schema
} // namespace quarry
