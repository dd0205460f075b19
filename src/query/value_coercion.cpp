#include "query/value_coercion.h"
#include "query/query_errors.h"

#include <stdexcept>

namespace quarry {
namespace query {

double ValueCoercer::decimalToDouble(const Decimal& d) const {
    try {
        size_t consumed = 0;
        double v = std::stod(d.digits, &consumed);
        if (consumed != d.digits.size()) {
            throw std::invalid_argument(d.digits);
        }
        return v;
    } catch (const std::logic_error&) {
        throw QueryValidationError(query_text_, "Malformed decimal value " + d.digits);
    }
}

PropertyValue ValueCoercer::toProperty(const Value& value) const {
    return std::visit(overloaded{
        [](std::monostate) -> PropertyValue { return std::monostate{}; },
        [](bool b) -> PropertyValue { return b; },
        [](int64_t i) -> PropertyValue { return i; },
        [](double d) -> PropertyValue { return d; },
        [](char c) -> PropertyValue { return std::string(1, c); },
        [](const std::string& s) -> PropertyValue { return s; },
        [this](const Decimal& d) -> PropertyValue { return decimalToDouble(d); },
        [](const Bytes& b) -> PropertyValue { return Blob{b}; },
        [](const EnumValue& e) -> PropertyValue { return e.name; },
        [](const Key& k) -> PropertyValue { return k; },
        [this](const ValueList&) -> PropertyValue {
            throw QueryValidationError(query_text_,
                "Collection parameters are only supported when filtering on primary key.");
        }
    }, value.data);
}

PropertyValue ValueCoercer::toProperty(const Value& value, const schema::MemberMetadata& member) const {
    if (member.type == schema::FieldType::Key && !value.isNull() && !value.isList()) {
        return toKey(value);
    }
    return toProperty(value);
}

Key ValueCoercer::toKey(const Value& value) const {
    if (auto k = value.getIf<Key>()) {
        return *k;
    }
    if (auto s = value.getIf<std::string>()) {
        if (auto decoded = Key::fromString(*s)) {
            return *decoded;
        }
        if (!s->empty()) {
            return Key::fromName(kind_, *s);
        }
    }
    if (auto i = value.getIf<int64_t>()) {
        return Key::fromId(kind_, *i);
    }
    throw QueryValidationError(query_text_,
        "Value " + value.toString() + " cannot be converted to a key of kind " + kind_);
}

} // namespace query
} // namespace quarry
