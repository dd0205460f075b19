#include "query/member_resolver.h"
#include "query/query_errors.h"

namespace quarry {
namespace query {

std::vector<std::string> MemberResolver::stripAlias(const std::vector<std::string>& path) const {
    if (path.size() > 1 && path.front() == alias_) {
        return std::vector<std::string>(path.begin() + 1, path.end());
    }
    return path;
}

ResolvedMember MemberResolver::resolve(const std::vector<std::string>& path) const {
    ResolvedMember out;
    out.tuples = stripAlias(path);
    if (out.tuples.empty()) {
        throw QueryValidationError(query_text_, "Empty member path");
    }

    const auto& first = out.tuples.front();
    const schema::MemberMetadata* member = cls_.member(first);
    if (!member) {
        throw QueryValidationError(query_text_,
            "No meta-data for member named " + first + " on class " + cls_.typeName);
    }

    for (size_t i = 1; i < out.tuples.size(); ++i) {
        if (!member->isEmbedded()) {
            throw UnsupportedFeatureError(query_text_,
                "Can only filter by properties of a sub-object if the sub-object is embedded.");
        }
        const auto* next = member->embeddedMember(out.tuples[i]);
        if (!next) {
            throw QueryValidationError(query_text_,
                "No meta-data for member named " + out.tuples[i] + " on embedded member " + member->name +
                " of class " + cls_.typeName);
        }
        member = next;
        out.embedded = true;
    }

    out.member = member;
    out.propertyName = member->propertyName();
    return out;
}

} // namespace query
} // namespace quarry
