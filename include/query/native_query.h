#pragma once

#include "storage/key.h"
#include "storage/record.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry {
namespace query {

// Property name the store uses to filter and order by record key
inline constexpr const char* kKeyProperty = "__key__";

enum class FilterOperator {
    Equal,
    GreaterThan,
    GreaterThanOrEqual,
    LessThan,
    LessThanOrEqual
};

const char* filterOperatorName(FilterOperator op);

struct NativeFilter {
    std::string property;
    FilterOperator op;
    PropertyValue value;

    bool operator==(const NativeFilter& other) const {
        return property == other.property && op == other.op && propertyEquals(value, other.value);
    }
};

enum class SortDirection { Ascending, Descending };

struct SortClause {
    std::string property;
    SortDirection direction = SortDirection::Ascending;

    bool operator==(const SortClause& other) const {
        return property == other.property && direction == other.direction;
    }
};

/// Filtered, optionally ancestor-scoped and sorted scan over one kind.
struct ScanQuery {
    std::string kind;
    std::vector<NativeFilter> filters;
    std::optional<Key> ancestor;
    std::vector<SortClause> sorts;
    bool keysOnly = false;

    std::string toString() const;
};

/// Direct fetch of a fixed set of keys. Never carries filters or sorts.
struct BatchLookup {
    std::string kind;
    std::vector<Key> keys;

    std::string toString() const;
};

using CompiledQuery = std::variant<ScanQuery, BatchLookup>;

std::string toString(const CompiledQuery& query);

} // namespace query
} // namespace quarry
