#pragma once

#include "storage/key.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry {

/// Short opaque byte string stored as a native property.
struct Blob {
    std::vector<uint8_t> bytes;

    bool operator==(const Blob& other) const { return bytes == other.bytes; }
    bool operator!=(const Blob& other) const { return bytes != other.bytes; }
};

/// Value as the store holds it
using PropertyValue = std::variant<
    std::monostate,  // null
    bool,
    int64_t,
    double,
    std::string,
    Blob,
    Key
>;

/// Total order across all property values:
/// null < numbers < bool < blob < string < key.
/// Integers and doubles compare numerically.
int compareProperty(const PropertyValue& a, const PropertyValue& b);

bool propertyEquals(const PropertyValue& a, const PropertyValue& b);

std::string propertyToString(const PropertyValue& v);

nlohmann::json propertyToJson(const PropertyValue& v);
PropertyValue propertyFromJson(const nlohmann::json& j);

/// A stored record: key plus named native properties.
struct Record {
    Key key;
    std::map<std::string, PropertyValue> properties;

    std::optional<PropertyValue> get(const std::string& property) const;
    void set(const std::string& property, PropertyValue value) {
        properties[property] = std::move(value);
    }

    nlohmann::json toJson() const;
    static Record fromJson(const nlohmann::json& j);
};

} // namespace quarry
