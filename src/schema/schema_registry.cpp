#include "schema/schema_registry.h"
#include "utils/logger.h"

#include <yaml-cpp/yaml.h>

namespace quarry {
namespace schema {

namespace {

FieldType parseType(const std::string& typeName, const std::string& owner) {
    auto type = fieldTypeFromString(typeName);
    if (!type) {
        throw SchemaError("Unknown field type '" + typeName + "' on " + owner);
    }
    return *type;
}

MemberMetadata memberFromYaml(const YAML::Node& node, const std::string& owner) {
    MemberMetadata m;
    m.name = node["name"].as<std::string>("");
    if (m.name.empty()) {
        throw SchemaError("Member without a name on " + owner);
    }
    m.type = parseType(node["type"].as<std::string>("string"), owner + "." + m.name);
    m.primaryKey = node["primary_key"].as<bool>(false);
    m.parentKey = node["parent_key"].as<bool>(false);
    if (node["column"]) {
        m.column = node["column"].as<std::string>();
    }
    if (node["members"]) {
        for (const auto& child : node["members"]) {
            m.embeddedMembers.push_back(memberFromYaml(child, owner + "." + m.name));
        }
    }
    m.relatedKind = node["related_kind"].as<std::string>("");
    m.relatedIsParent = node["related_is_parent"].as<bool>(false);
    return m;
}

MemberMetadata memberFromJson(const nlohmann::json& j, const std::string& owner) {
    MemberMetadata m;
    m.name = j.value("name", "");
    if (m.name.empty()) {
        throw SchemaError("Member without a name on " + owner);
    }
    m.type = parseType(j.value("type", "string"), owner + "." + m.name);
    m.primaryKey = j.value("primary_key", false);
    m.parentKey = j.value("parent_key", false);
    if (j.contains("column")) {
        m.column = j["column"].get<std::string>();
    }
    if (j.contains("members")) {
        for (const auto& child : j["members"]) {
            m.embeddedMembers.push_back(memberFromJson(child, owner + "." + m.name));
        }
    }
    m.relatedKind = j.value("related_kind", "");
    m.relatedIsParent = j.value("related_is_parent", false);
    return m;
}

nlohmann::json memberToJson(const MemberMetadata& m) {
    nlohmann::json j = {{"name", m.name}, {"type", fieldTypeName(m.type)}};
    if (m.primaryKey) j["primary_key"] = true;
    if (m.parentKey) j["parent_key"] = true;
    if (m.column) j["column"] = *m.column;
    if (!m.relatedKind.empty()) j["related_kind"] = m.relatedKind;
    if (m.relatedIsParent) j["related_is_parent"] = true;
    if (!m.embeddedMembers.empty()) {
        j["members"] = nlohmann::json::array();
        for (const auto& child : m.embeddedMembers) {
            j["members"].push_back(memberToJson(child));
        }
    }
    return j;
}

void validate(const ClassMetadata& cls) {
    if (cls.typeName.empty()) {
        throw SchemaError("Class without a type name");
    }
    if (cls.kind.empty()) {
        throw SchemaError("Class " + cls.typeName + " has no kind");
    }
    int pkCount = 0;
    int parentCount = 0;
    for (const auto& m : cls.members) {
        if (m.primaryKey) ++pkCount;
        if (m.parentKey) ++parentCount;
        if (m.parentKey && m.type != FieldType::Key) {
            throw SchemaError("Parent member " + cls.typeName + "." + m.name + " must be of type key");
        }
        if (m.isEmbedded() && m.embeddedMembers.empty()) {
            throw SchemaError("Embedded member " + cls.typeName + "." + m.name + " declares no members");
        }
        if (m.isRelation() && m.relatedKind.empty()) {
            throw SchemaError("Relation member " + cls.typeName + "." + m.name + " names no related kind");
        }
        if (m.relatedIsParent && !m.isRelation()) {
            throw SchemaError("Member " + cls.typeName + "." + m.name + " is not a relation but sets related_is_parent");
        }
    }
    if (pkCount != 1) {
        throw SchemaError("Class " + cls.typeName + " must declare exactly one primary key member");
    }
    if (parentCount > 1) {
        throw SchemaError("Class " + cls.typeName + " declares more than one parent member");
    }
}

SchemaRegistry fromYamlNode(const YAML::Node& root) {
    SchemaRegistry registry;
    for (const auto& node : root["classes"]) {
        ClassMetadata cls;
        cls.typeName = node["type"].as<std::string>("");
        cls.kind = node["kind"].as<std::string>(cls.typeName);
        for (const auto& member : node["members"]) {
            cls.members.push_back(memberFromYaml(member, cls.typeName));
        }
        registry.registerClass(std::move(cls));
    }
    return registry;
}

} // namespace

void SchemaRegistry::registerClass(ClassMetadata cls) {
    validate(cls);
    QUARRY_DEBUG("Registered class {} (kind={}, members={})", cls.typeName, cls.kind, cls.members.size());
    auto name = cls.typeName;
    classes_[name] = std::move(cls);
}

const ClassMetadata* SchemaRegistry::metadataFor(const std::string& typeName) const {
    auto it = classes_.find(typeName);
    return it == classes_.end() ? nullptr : &it->second;
}

SchemaRegistry SchemaRegistry::loadFromYaml(const std::string& yaml_path) {
    try {
        auto registry = fromYamlNode(YAML::LoadFile(yaml_path));
        QUARRY_INFO("Loaded {} classes from {}", registry.size(), yaml_path);
        return registry;
    } catch (const YAML::Exception& e) {
        throw SchemaError("Failed to load schema from " + yaml_path + ": " + e.what());
    }
}

SchemaRegistry SchemaRegistry::fromYamlString(const std::string& yaml) {
    try {
        return fromYamlNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw SchemaError(std::string("Failed to parse schema: ") + e.what());
    }
}

SchemaRegistry SchemaRegistry::fromJson(const nlohmann::json& j) {
    SchemaRegistry registry;
    try {
        for (const auto& node : j.at("classes")) {
            ClassMetadata cls;
            cls.typeName = node.value("type", "");
            cls.kind = node.value("kind", cls.typeName);
            for (const auto& member : node.value("members", nlohmann::json::array())) {
                cls.members.push_back(memberFromJson(member, cls.typeName));
            }
            registry.registerClass(std::move(cls));
        }
    } catch (const nlohmann::json::exception& e) {
        throw SchemaError(std::string("Failed to parse schema: ") + e.what());
    }
    return registry;
}

nlohmann::json SchemaRegistry::toJson() const {
    nlohmann::json classes = nlohmann::json::array();
    for (const auto& [name, cls] : classes_) {
        nlohmann::json members = nlohmann::json::array();
        for (const auto& m : cls.members) {
            members.push_back(memberToJson(m));
        }
        classes.push_back({{"type", cls.typeName}, {"kind", cls.kind}, {"members", members}});
    }
    return {{"classes", classes}};
}

} // namespace schema
} // namespace quarry
