#include "query/native_query.h"

namespace quarry {
namespace query {

const char* filterOperatorName(FilterOperator op) {
    switch (op) {
        case FilterOperator::Equal: return "EQUAL";
        case FilterOperator::GreaterThan: return "GREATER_THAN";
        case FilterOperator::GreaterThanOrEqual: return "GREATER_THAN_OR_EQUAL";
        case FilterOperator::LessThan: return "LESS_THAN";
        case FilterOperator::LessThanOrEqual: return "LESS_THAN_OR_EQUAL";
    }
    return "?";
}

std::string ScanQuery::toString() const {
    std::string out = "SCAN " + kind;
    if (keysOnly) out += " KEYS_ONLY";
    if (ancestor) out += " ANCESTOR " + ancestor->debugString();
    for (size_t i = 0; i < filters.size(); ++i) {
        out += i == 0 ? " WHERE " : " AND ";
        out += filters[i].property + " " + filterOperatorName(filters[i].op) + " " +
               propertyToString(filters[i].value);
    }
    for (size_t i = 0; i < sorts.size(); ++i) {
        out += i == 0 ? " ORDER BY " : ", ";
        out += sorts[i].property;
        out += sorts[i].direction == SortDirection::Ascending ? " ASC" : " DESC";
    }
    return out;
}

std::string BatchLookup::toString() const {
    std::string out = "GET " + kind + " [";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) out += ", ";
        out += keys[i].debugString();
    }
    return out + "]";
}

std::string toString(const CompiledQuery& query) {
    return std::visit([](const auto& q) { return q.toString(); }, query);
}

} // namespace query
} // namespace quarry
