#pragma once

#include "schema/metadata.h"

#include <string>
#include <vector>

namespace quarry {
namespace query {

struct ResolvedMember {
    const schema::MemberMetadata* member = nullptr;
    // Store property the member is written to
    std::string propertyName;
    // Reached through an embedded value
    bool embedded = false;
    // Path with the candidate alias removed
    std::vector<std::string> tuples;
};

/// Maps dotted member paths of one candidate class to store properties.
class MemberResolver {
public:
    MemberResolver(const schema::ClassMetadata& cls, std::string alias, std::string queryText)
        : cls_(cls), alias_(std::move(alias)), query_text_(std::move(queryText)) {}

    /// Drops a leading alias segment from multi-segment paths.
    std::vector<std::string> stripAlias(const std::vector<std::string>& path) const;

    /// Throws QueryValidationError for unknown members and
    /// UnsupportedFeatureError for paths through non-embedded members.
    ResolvedMember resolve(const std::vector<std::string>& path) const;

    bool isAlias(const std::vector<std::string>& path) const {
        return path.size() == 1 && path.front() == alias_;
    }

    const schema::ClassMetadata& classMetadata() const { return cls_; }
    const std::string& alias() const { return alias_; }

private:
    const schema::ClassMetadata& cls_;
    std::string alias_;
    std::string query_text_;
};

} // namespace query
} // namespace quarry
