#pragma once

#include "query/member_resolver.h"
#include "query/query_compilation.h"

#include <string>
#include <vector>

namespace quarry {
namespace query {

struct ResultShape {
    enum class Kind { WholeRecord, KeysOnly, FieldProjection, Count };

    Kind kind = Kind::WholeRecord;
    // Projected members in select order (FieldProjection only). An entry
    // without a member stands for the candidate record itself.
    std::vector<ResolvedMember> projection;

    bool isCount() const { return kind == Kind::Count; }
};

const char* resultShapeName(ResultShape::Kind kind);

/**
 * Classifies the result clause of a query.
 *
 *  - no result expressions: whole records
 *  - count() or count(alias): a count
 *  - the candidate alias alone, or only key members: keys only
 *  - any other member reference: a projection of those members
 *
 * Aggregates cannot be mixed with row results; other expressions are rejected.
 */
class ResultShapeValidator {
public:
    ResultShapeValidator(const QueryCompilation& compilation, const schema::ClassMetadata& cls)
        : compilation_(compilation), resolver_(cls, compilation.candidateAlias, compilation.queryText) {}

    ResultShape validate() const;

private:
    const QueryCompilation& compilation_;
    MemberResolver resolver_;
};

} // namespace query
} // namespace quarry
