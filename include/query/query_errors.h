#pragma once

#include "query/predicate.h"

#include <optional>
#include <stdexcept>
#include <string>

namespace quarry {
namespace query {

/// Base of every error raised while translating or executing a query.
/// what() reads "Problem with query <text>: <detail>".
class QueryError : public std::runtime_error {
public:
    QueryError(const std::string& queryText, const std::string& detail)
        : std::runtime_error(format(queryText, detail)), query_text_(queryText), detail_(detail) {}

    const std::string& queryText() const { return query_text_; }
    const std::string& detail() const { return detail_; }

private:
    static std::string format(const std::string& queryText, const std::string& detail) {
        return "Problem with query <" + queryText + ">: " + detail;
    }

    std::string query_text_;
    std::string detail_;
};

/// The store cannot execute this construct.
class UnsupportedFeatureError : public QueryError {
public:
    UnsupportedFeatureError(const std::string& queryText, const std::string& reason)
        : QueryError(queryText, reason) {}

    const std::string& reason() const { return detail(); }
};

/// An operator with no native counterpart.
class UnsupportedOperatorError : public UnsupportedFeatureError {
public:
    UnsupportedOperatorError(const std::string& queryText, const std::string& operatorName,
                             std::optional<Operator> op = std::nullopt)
        : UnsupportedFeatureError(queryText, "The datastore does not support operator " + operatorName + "."),
          operator_name_(operatorName), op_(op) {}

    UnsupportedOperatorError(const std::string& queryText, Operator op)
        : UnsupportedOperatorError(queryText, query::operatorName(op), op) {}

    const std::string& operatorName() const { return operator_name_; }
    std::optional<Operator> op() const { return op_; }

private:
    std::string operator_name_;
    std::optional<Operator> op_;
};

/// Caller or schema mistake: missing metadata, unknown member, bad parameter.
class QueryValidationError : public QueryError {
public:
    using QueryError::QueryError;
};

/// Failure reported by the store while serving the query.
class StoreAccessError : public QueryError {
public:
    using QueryError::QueryError;
};

} // namespace query
} // namespace quarry
