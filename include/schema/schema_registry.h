#pragma once

#include "schema/metadata.h"

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <string>

namespace quarry {
namespace schema {

class SchemaError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * In-memory MetadataProvider. Classes are registered directly or loaded
 * from a schema document:
 *
 *   classes:
 *     - type: Person
 *       kind: person
 *       members:
 *         - { name: id, type: key, primary_key: true }
 *         - { name: company, type: key, parent_key: true }
 *         - { name: lastName, type: string, column: last_name }
 *
 * Loading validates each class and throws SchemaError on the first defect.
 */
class SchemaRegistry : public MetadataProvider {
public:
    SchemaRegistry() = default;

    void registerClass(ClassMetadata cls);

    const ClassMetadata* metadataFor(const std::string& typeName) const override;
    size_t size() const { return classes_.size(); }

    static SchemaRegistry loadFromYaml(const std::string& yaml_path);
    static SchemaRegistry fromYamlString(const std::string& yaml);
    static SchemaRegistry fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

private:
    std::map<std::string, ClassMetadata> classes_;
};

} // namespace schema
} // namespace quarry
