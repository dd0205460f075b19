#include "query/materializer.h"

namespace quarry {
namespace query {

namespace {

nlohmann::json domainJson(const PropertyValue& v) {
    if (const auto* k = std::get_if<Key>(&v)) {
        return k->toString();
    }
    return propertyToJson(v);
}

nlohmann::json propertyOrNull(const Record& record, const std::string& property) {
    auto v = record.get(property);
    return v ? domainJson(*v) : nlohmann::json(nullptr);
}

} // namespace

nlohmann::json JsonMaterializer::memberValue(const Record& record, const schema::ClassMetadata& cls,
                                             const schema::MemberMetadata& member) {
    if (member.primaryKey) {
        return record.key.toString();
    }
    if (member.parentKey || (member.isRelation() && member.relatedIsParent)) {
        auto parent = record.key.parent();
        return parent ? nlohmann::json(parent->toString()) : nlohmann::json(nullptr);
    }
    if (member.isEmbedded()) {
        nlohmann::json nested = nlohmann::json::object();
        for (const auto& child : member.embeddedMembers) {
            nested[child.name] = child.isEmbedded() ? memberValue(record, cls, child)
                                                    : propertyOrNull(record, child.propertyName());
        }
        return nested;
    }
    return propertyOrNull(record, member.propertyName());
}

nlohmann::json JsonMaterializer::buildWhole(const Record& record, const schema::ClassMetadata& cls) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& member : cls.members) {
        out[member.name] = memberValue(record, cls, member);
    }
    return out;
}

nlohmann::json JsonMaterializer::buildIdentifierOnly(const Record& record, const schema::ClassMetadata&) {
    return record.key.toString();
}

nlohmann::json JsonMaterializer::buildProjection(const Record& record, const schema::ClassMetadata& cls,
                                                 const std::vector<ResolvedMember>& fields) {
    nlohmann::json row = nlohmann::json::array();
    for (const auto& field : fields) {
        if (!field.member) {
            row.push_back(buildWhole(record, cls));
        } else if (field.embedded && !field.member->isEmbedded()) {
            row.push_back(propertyOrNull(record, field.propertyName));
        } else {
            row.push_back(memberValue(record, cls, *field.member));
        }
    }
    if (row.size() == 1) {
        return row.front();
    }
    return row;
}

} // namespace query
} // namespace quarry
