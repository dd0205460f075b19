#pragma once

#include "query/member_resolver.h"
#include "query/native_query.h"
#include "query/query_compilation.h"

#include <vector>

namespace quarry {
namespace query {

/// Translates ordering entries into native sort clauses.
class SortCompiler {
public:
    SortCompiler(const QueryCompilation& compilation, const schema::ClassMetadata& cls)
        : compilation_(compilation), resolver_(cls, compilation.candidateAlias, compilation.queryText) {}

    /// Throws UnsupportedFeatureError for parent sorts, non-member
    /// expressions, or any ordering when `batchLookup` is set.
    std::vector<SortClause> compile(bool batchLookup) const;

    static SortDirection directionFor(const std::optional<std::string>& direction);

private:
    const QueryCompilation& compilation_;
    MemberResolver resolver_;
};

} // namespace query
} // namespace quarry
