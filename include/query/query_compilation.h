#pragma once

#include "query/predicate.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quarry {
namespace query {

enum class QueryType { Select, BulkDelete, BulkUpdate };

// Per-query extension flags
inline constexpr const char* kExtExcludeQueryFromTxn = "quarry.exclude-query-from-txn";
inline constexpr const char* kExtAccurateDelete = "quarry.slow-but-more-accurate-delete";

struct JoinClause {
    std::vector<std::string> path;
    std::string alias;
};

struct FromClause {
    std::string candidateType;
    std::string alias;
    std::vector<JoinClause> joins;
};

struct OrderEntry {
    NodePtr expression;
    // "ascending" / "descending"; unset means ascending
    std::optional<std::string> direction;
};

/// Values bound to the parameters of a compiled query.
struct QueryParameters {
    std::map<std::string, Value> named;
    std::map<int, Value> positional;

    QueryParameters& set(const std::string& name, Value v) {
        named[name] = std::move(v);
        return *this;
    }
    QueryParameters& set(int position, Value v) {
        positional[position] = std::move(v);
        return *this;
    }

    // Positional binding wins over a named one
    std::optional<Value> lookup(const Parameter& p) const;
    std::optional<Value> lookup(const std::string& name) const;
};

/**
 * Output of the external query-language compiler: the candidate class, the
 * filter/order/result trees and any grouping constructs. Read-only here.
 */
struct QueryCompilation {
    std::string queryText;
    std::string candidateType;
    std::string candidateAlias = "this";
    QueryType type = QueryType::Select;

    std::vector<FromClause> from;
    NodePtr filter;
    std::vector<OrderEntry> ordering;
    std::vector<NodePtr> result;
    std::vector<NodePtr> grouping;
    NodePtr having;

    std::map<std::string, bool> extensions;

    std::optional<bool> extension(const std::string& name) const {
        auto it = extensions.find(name);
        if (it == extensions.end()) return std::nullopt;
        return it->second;
    }
};

} // namespace query
} // namespace quarry
