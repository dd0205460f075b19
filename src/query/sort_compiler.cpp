#include "query/sort_compiler.h"
#include "query/query_errors.h"

namespace quarry {
namespace query {

SortDirection SortCompiler::directionFor(const std::optional<std::string>& direction) {
    if (!direction || *direction == "ascending") {
        return SortDirection::Ascending;
    }
    return SortDirection::Descending;
}

std::vector<SortClause> SortCompiler::compile(bool batchLookup) const {
    const auto& queryText = compilation_.queryText;
    std::vector<SortClause> sorts;
    if (compilation_.ordering.empty()) {
        return sorts;
    }
    if (batchLookup) {
        throw UnsupportedFeatureError(queryText,
            "Ordering is not supported together with a batch lookup by primary key.");
    }

    for (const auto& entry : compilation_.ordering) {
        const auto* id = entry.expression ? std::get_if<Identifier>(&entry.expression->node) : nullptr;
        if (!id) {
            throw UnsupportedFeatureError(queryText,
                "Cannot sort by expression " + (entry.expression ? entry.expression->toString() : "null") + ".");
        }
        ResolvedMember resolved = resolver_.resolve(id->path);
        if (resolved.member->parentKey) {
            throw UnsupportedFeatureError(queryText, "Cannot sort by parent.");
        }
        if (resolved.member->isRelation()) {
            throw UnsupportedFeatureError(queryText, "Cannot sort by relation member " + resolved.member->name + ".");
        }
        SortClause clause;
        clause.property = resolved.member->primaryKey ? std::string(kKeyProperty) : resolved.propertyName;
        clause.direction = directionFor(entry.direction);
        sorts.push_back(std::move(clause));
    }
    return sorts;
}

} // namespace query
} // namespace quarry
