#include "query/result_shape.h"
#include "query/query_errors.h"

namespace quarry {
namespace query {

const char* resultShapeName(ResultShape::Kind kind) {
    switch (kind) {
        case ResultShape::Kind::WholeRecord: return "whole_record";
        case ResultShape::Kind::KeysOnly: return "keys_only";
        case ResultShape::Kind::FieldProjection: return "projection";
        case ResultShape::Kind::Count: return "count";
    }
    return "whole_record";
}

ResultShape ResultShapeValidator::validate() const {
    const auto& queryText = compilation_.queryText;
    ResultShape shape;

    bool aggregate = false;
    bool rows = false;
    bool keysOnly = false;
    bool projection = false;
    std::vector<ResolvedMember> members;

    for (const auto& expr : compilation_.result) {
        if (!expr) continue;
        if (const auto* call = std::get_if<MethodCall>(&expr->node)) {
            if (call->name != "count" || call->receiver) {
                throw UnsupportedOperatorError(queryText, call->name);
            }
            if (call->args.size() > 1) {
                throw UnsupportedFeatureError(queryText, "count() accepts at most one argument.");
            }
            if (call->args.size() == 1) {
                const auto* arg = std::get_if<Identifier>(&call->args[0]->node);
                if (!arg || !resolver_.isAlias(arg->path)) {
                    throw UnsupportedFeatureError(queryText,
                        "Only count() of the candidate is supported, found " + expr->toString() + ".");
                }
            }
            aggregate = true;
        } else if (const auto* id = std::get_if<Identifier>(&expr->node)) {
            rows = true;
            if (resolver_.isAlias(id->path)) {
                keysOnly = true;
                ResolvedMember self;
                self.tuples = id->path;
                members.push_back(std::move(self));
                continue;
            }
            ResolvedMember resolved = resolver_.resolve(id->path);
            if (resolved.member->primaryKey && !resolved.embedded) {
                keysOnly = true;
            } else {
                projection = true;
            }
            members.push_back(std::move(resolved));
        } else {
            throw UnsupportedFeatureError(queryText,
                "Unsupported result expression " + expr->toString() + ".");
        }
    }

    if (aggregate && rows) {
        throw UnsupportedFeatureError(queryText, "Cannot combine an aggregate results with row results.");
    }
    if (aggregate) {
        shape.kind = ResultShape::Kind::Count;
    } else if (projection) {
        shape.kind = ResultShape::Kind::FieldProjection;
        shape.projection = std::move(members);
    } else if (keysOnly) {
        shape.kind = ResultShape::Kind::KeysOnly;
    }
    return shape;
}

} // namespace query
} // namespace quarry
