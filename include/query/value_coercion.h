#pragma once

#include "query/value.h"
#include "schema/metadata.h"
#include "storage/record.h"

#include <string>

namespace quarry {
namespace query {

/**
 * Converts domain values into the store's native representation.
 *
 * Enums become their constant name, byte arrays blobs, decimals doubles and
 * characters one-character strings. Key-typed members accept key text, a
 * plain name or a numeric id of the candidate kind.
 */
class ValueCoercer {
public:
    ValueCoercer(std::string candidateKind, std::string queryText)
        : kind_(std::move(candidateKind)), query_text_(std::move(queryText)) {}

    PropertyValue toProperty(const Value& value) const;
    PropertyValue toProperty(const Value& value, const schema::MemberMetadata& member) const;

    /// Throws QueryValidationError when the value cannot address a record.
    Key toKey(const Value& value) const;

    double decimalToDouble(const Decimal& d) const;

private:
    std::string kind_;
    std::string query_text_;
};

} // namespace query
} // namespace quarry
