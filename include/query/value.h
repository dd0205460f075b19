#pragma once

#include "storage/key.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace quarry {
namespace query {

/// Arbitrary-precision decimal kept as its text digits ("12.50", "-3").
struct Decimal {
    std::string digits;
    bool operator==(const Decimal& other) const { return digits == other.digits; }
};

/// Enumeration constant; stored by name.
struct EnumValue {
    std::string type;
    std::string name;
    bool operator==(const EnumValue& other) const {
        return type == other.type && name == other.name;
    }
};

struct Value;
using ValueList = std::vector<Value>;
using Bytes = std::vector<uint8_t>;

/// Domain-side value as it appears in literals and bound parameters.
struct Value {
    using Storage = std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        char,
        std::string,
        Decimal,
        Bytes,
        EnumValue,
        Key,
        ValueList
    >;

    Storage data;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : data(b) {}
    Value(int i) : data(static_cast<int64_t>(i)) {}
    Value(int64_t i) : data(i) {}
    Value(double d) : data(d) {}
    Value(char c) : data(c) {}
    Value(const char* s) : data(std::string(s)) {}
    Value(std::string s) : data(std::move(s)) {}
    Value(Decimal d) : data(std::move(d)) {}
    Value(Bytes b) : data(std::move(b)) {}
    Value(EnumValue e) : data(std::move(e)) {}
    Value(Key k) : data(std::move(k)) {}
    Value(ValueList l) : data(std::move(l)) {}

    bool isNull() const { return std::holds_alternative<std::monostate>(data); }
    bool isList() const { return std::holds_alternative<ValueList>(data); }
    bool isString() const { return std::holds_alternative<std::string>(data); }

    template<typename T>
    const T* getIf() const { return std::get_if<T>(&data); }

    std::string toString() const;

    bool operator==(const Value& other) const { return data == other.data; }
    bool operator!=(const Value& other) const { return !(*this == other); }
};

} // namespace query
} // namespace quarry
