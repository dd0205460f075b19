#pragma once

#include "query/member_resolver.h"
#include "schema/metadata.h"
#include "storage/record.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace quarry {
namespace query {

/// Turns store records into the values handed back to callers.
class Materializer {
public:
    virtual ~Materializer() = default;

    virtual nlohmann::json buildWhole(const Record& record, const schema::ClassMetadata& cls) = 0;
    virtual nlohmann::json buildIdentifierOnly(const Record& record, const schema::ClassMetadata& cls) = 0;
    virtual nlohmann::json buildProjection(const Record& record, const schema::ClassMetadata& cls,
                                           const std::vector<ResolvedMember>& fields) = 0;
};

/**
 * Builds JSON documents keyed by member name. Keys are rendered as their
 * text form; a projection of one field yields the bare value, several
 * fields an array in select order.
 */
class JsonMaterializer : public Materializer {
public:
    nlohmann::json buildWhole(const Record& record, const schema::ClassMetadata& cls) override;
    nlohmann::json buildIdentifierOnly(const Record& record, const schema::ClassMetadata& cls) override;
    nlohmann::json buildProjection(const Record& record, const schema::ClassMetadata& cls,
                                   const std::vector<ResolvedMember>& fields) override;

private:
    nlohmann::json memberValue(const Record& record, const schema::ClassMetadata& cls,
                               const schema::MemberMetadata& member);
};

} // namespace query
} // namespace quarry
