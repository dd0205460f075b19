#pragma once

#include "query/member_resolver.h"
#include "query/native_query.h"
#include "query/query_compilation.h"
#include "query/value_coercion.h"
#include "schema/metadata.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry {
namespace query {

/// Filters and ancestor constraint of a scan.
struct FilterSet {
    std::vector<NativeFilter> filters;
    std::optional<Key> ancestor;
};

using PredicateResult = std::variant<FilterSet, BatchLookup>;

enum class CompileMode { Scan, Batch };

/// Smallest string greater than every string starting with `prefix`,
/// or nullopt when none exists (empty or all 0xFF bytes).
std::optional<std::string> prefixUpperBound(const std::string& prefix);

/**
 * Compiles a filter tree into native filters or a batch key lookup.
 *
 * Compilation runs in two phases. classify() walks the tree once, rejects
 * unsupported operators anywhere in it and decides whether the filter is a
 * primary-key batch lookup (pk == list, or list.contains(pk)) or a scan.
 * compile() then produces the matching immutable result.
 */
class PredicateCompiler {
public:
    // Milliseconds since the epoch
    using Clock = std::function<int64_t()>;

    PredicateCompiler(const QueryCompilation& compilation,
                      const schema::ClassMetadata& cls,
                      const QueryParameters& params,
                      Clock clock = {});

    CompileMode classify() const;
    PredicateResult compile() const;

private:
    struct BatchCandidate {
        std::vector<Key> keys;
    };

    // Phase 1
    void checkOperators(const NodePtr& node, bool valueSide) const;
    std::optional<BatchCandidate> scanForBatch() const;
    void collectLeaves(const NodePtr& node, std::vector<NodePtr>& leaves) const;
    std::optional<BatchCandidate> batchCandidate(const NodePtr& leaf) const;
    bool isPrimaryKeyPath(const NodePtr& node) const;
    // Literal, parameter, clock constant or implicit parameter
    bool isValueNode(const NodePtr& node) const;

    // Phase 2
    void addExpression(const NodePtr& node, FilterSet& out) const;
    void addComparison(const std::vector<std::string>& path, Operator op, const Value& operand,
                       FilterSet& out) const;
    void addRelationComparison(const schema::MemberMetadata& member, Operator op, const Value& operand,
                               FilterSet& out) const;
    void addMethodCall(const MethodCall& call, FilterSet& out) const;
    void addPrefixFilters(const std::vector<std::string>& path, const std::string& prefix,
                          FilterSet& out) const;

    Value operandValue(const NodePtr& node) const;
    Value parameterValue(const Parameter& p) const;
    Value negate(const Value& v) const;
    Key parentKey(const Value& v) const;

    const QueryCompilation& compilation_;
    const schema::ClassMetadata& cls_;
    const QueryParameters& params_;
    Clock clock_;
    MemberResolver resolver_;
    ValueCoercer coercer_;
};

} // namespace query
} // namespace quarry
