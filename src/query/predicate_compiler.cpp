#include "query/predicate_compiler.h"
#include "query/operator_map.h"
#include "query/query_errors.h"
#include "utils/logger.h"

#include <chrono>
#include <limits>
#include <set>

namespace quarry {
namespace query {

namespace {

int64_t systemNowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool isCurrentTimeConstant(const std::vector<std::string>& path) {
    return path.size() == 1 && (path[0] == "CURRENT_TIMESTAMP" || path[0] == "CURRENT_DATE");
}

// Mirror of `op` for swapped operands (value op field -> field op' value)
Operator mirror(Operator op) {
    switch (op) {
        case Operator::Lt: return Operator::Gt;
        case Operator::Lte: return Operator::Gte;
        case Operator::Gt: return Operator::Lt;
        case Operator::Gte: return Operator::Lte;
        default: return op;
    }
}

const Identifier* asIdentifier(const NodePtr& node) {
    return node ? std::get_if<Identifier>(&node->node) : nullptr;
}

} // namespace

std::optional<std::string> prefixUpperBound(const std::string& prefix) {
    std::string bound = prefix;
    while (!bound.empty() && static_cast<unsigned char>(bound.back()) == 0xFF) {
        bound.pop_back();
    }
    if (bound.empty()) {
        return std::nullopt;
    }
    bound.back() = static_cast<char>(static_cast<unsigned char>(bound.back()) + 1);
    return bound;
}

PredicateCompiler::PredicateCompiler(const QueryCompilation& compilation,
                                     const schema::ClassMetadata& cls,
                                     const QueryParameters& params,
                                     Clock clock)
    : compilation_(compilation),
      cls_(cls),
      params_(params),
      clock_(clock ? std::move(clock) : Clock(systemNowMillis)),
      resolver_(cls, compilation.candidateAlias, compilation.queryText),
      coercer_(cls.kind, compilation.queryText) {}

bool PredicateCompiler::isValueNode(const NodePtr& node) const {
    if (!node) return false;
    if (std::holds_alternative<Literal>(node->node) || std::holds_alternative<Parameter>(node->node)) {
        return true;
    }
    const auto* id = asIdentifier(node);
    if (!id || id->path.size() != 1) return false;
    if (isCurrentTimeConstant(id->path)) return true;
    // Implicit parameter; a member of the same name takes precedence
    return cls_.member(id->path.front()) == nullptr && params_.lookup(id->path.front()).has_value();
}

// ---------------------------------------------------------------------------
// Phase 1: classification
// ---------------------------------------------------------------------------

void PredicateCompiler::checkOperators(const NodePtr& node, bool valueSide) const {
    if (!node) return;

    // A negated numeric literal is the only operator allowed on the value side
    if (valueSide) {
        if (auto u = std::get_if<UnaryExpr>(&node->node)) {
            if (u->op == Operator::Neg && u->operand && std::holds_alternative<Literal>(u->operand->node)) {
                return;
            }
        }
    }
    if (auto op = node->op(); op && isUnsupportedOperator(*op)) {
        throw UnsupportedOperatorError(compilation_.queryText, *op);
    }

    std::visit(overloaded{
        [&](const Conjunction& c) {
            checkOperators(c.left, false);
            checkOperators(c.right, false);
        },
        [&](const Disjunction& d) {
            checkOperators(d.left, false);
            checkOperators(d.right, false);
        },
        [&](const Comparison& c) {
            checkOperators(c.left, true);
            checkOperators(c.right, true);
        },
        [&](const UnaryExpr& u) { checkOperators(u.operand, valueSide); },
        [&](const MethodCall& m) {
            checkOperators(m.receiver, true);
            for (const auto& arg : m.args) {
                checkOperators(arg, true);
            }
        },
        [](const auto&) {}
    }, node->node);
}

void PredicateCompiler::collectLeaves(const NodePtr& node, std::vector<NodePtr>& leaves) const {
    if (!node) return;
    if (auto c = std::get_if<Conjunction>(&node->node)) {
        collectLeaves(c->left, leaves);
        collectLeaves(c->right, leaves);
        return;
    }
    leaves.push_back(node);
}

bool PredicateCompiler::isPrimaryKeyPath(const NodePtr& node) const {
    const auto* id = asIdentifier(node);
    if (!id) return false;
    auto tuples = resolver_.stripAlias(id->path);
    const auto* pk = cls_.primaryKeyMember();
    return pk && tuples.size() == 1 && tuples.front() == pk->name;
}

std::optional<PredicateCompiler::BatchCandidate> PredicateCompiler::batchCandidate(const NodePtr& leaf) const {
    NodePtr operand;
    std::optional<Operator> op;

    if (auto c = std::get_if<Comparison>(&leaf->node)) {
        if (isPrimaryKeyPath(c->left) && isValueNode(c->right)) {
            operand = c->right;
            op = c->op;
        } else if (isPrimaryKeyPath(c->right) && isValueNode(c->left)) {
            operand = c->left;
            op = c->op;
        }
    } else if (auto m = std::get_if<MethodCall>(&leaf->node)) {
        if (m->name == "contains" && m->args.size() == 1) {
            if (isPrimaryKeyPath(m->receiver) && isValueNode(m->args[0])) {
                operand = m->args[0];
            } else if (isValueNode(m->receiver) && isPrimaryKeyPath(m->args[0])) {
                operand = m->receiver;
            }
            op = Operator::Eq;
        }
    }
    if (!operand) return std::nullopt;

    Value value = operandValue(operand);
    const auto* list = value.getIf<ValueList>();
    if (!list) return std::nullopt;

    if (*op != Operator::Eq) {
        throw QueryValidationError(compilation_.queryText,
            "Batch lookup by primary key requires the equality operator, found " +
            std::string(operatorName(*op)));
    }

    BatchCandidate candidate;
    std::set<Key> seen;
    for (const auto& element : *list) {
        Key key = coercer_.toKey(element);
        if (seen.insert(key).second) {
            candidate.keys.push_back(std::move(key));
        }
    }
    return candidate;
}

CompileMode PredicateCompiler::classify() const {
    return scanForBatch().has_value() ? CompileMode::Batch : CompileMode::Scan;
}

std::optional<PredicateCompiler::BatchCandidate> PredicateCompiler::scanForBatch() const {
    checkOperators(compilation_.filter, false);

    std::vector<NodePtr> leaves;
    collectLeaves(compilation_.filter, leaves);

    std::optional<BatchCandidate> found;
    for (const auto& leaf : leaves) {
        if ((found = batchCandidate(leaf))) {
            break;
        }
    }
    if (found && leaves.size() > 1) {
        throw UnsupportedFeatureError(compilation_.queryText,
            "Batch lookup by primary key is only supported if no other filters are defined.");
    }
    return found;
}

// ---------------------------------------------------------------------------
// Phase 2: compilation
// ---------------------------------------------------------------------------

PredicateResult PredicateCompiler::compile() const {
    if (auto candidate = scanForBatch()) {
        BatchLookup lookup;
        lookup.kind = cls_.kind;
        lookup.keys = std::move(candidate->keys);
        QUARRY_DEBUG("Compiled batch lookup of {} keys for kind {}", lookup.keys.size(), lookup.kind);
        return lookup;
    }

    FilterSet out;
    addExpression(compilation_.filter, out);
    return out;
}

void PredicateCompiler::addExpression(const NodePtr& node, FilterSet& out) const {
    if (!node) return;
    if (auto op = node->op(); op && isUnsupportedOperator(*op)) {
        throw UnsupportedOperatorError(compilation_.queryText, *op);
    }

    std::visit(overloaded{
        [&](const Conjunction& c) {
            addExpression(c.left, out);
            addExpression(c.right, out);
        },
        [&](const Disjunction&) {
            throw UnsupportedFeatureError(compilation_.queryText, "Disjunctions are not supported.");
        },
        [&](const Comparison& c) {
            if (const auto* id = asIdentifier(c.left); id && !isValueNode(c.left)) {
                addComparison(id->path, c.op, operandValue(c.right), out);
            } else if (const auto* rid = asIdentifier(c.right); rid && isValueNode(c.left)) {
                addComparison(rid->path, mirror(c.op), operandValue(c.left), out);
            } else {
                throw UnsupportedFeatureError(compilation_.queryText,
                    "Unsupported comparison " + node->toString());
            }
        },
        [&](const UnaryExpr& u) {
            throw UnsupportedOperatorError(compilation_.queryText, u.op);
        },
        [&](const MethodCall& m) { addMethodCall(m, out); },
        [&](const Identifier&) {
            // Boolean member reference without a comparison
            QUARRY_DEBUG("Ignoring bare identifier {} in filter of {}", node->toString(), compilation_.queryText);
        },
        [&](const Literal&) {
            throw UnsupportedFeatureError(compilation_.queryText,
                "Unsupported filter component " + node->toString());
        },
        [&](const Parameter&) {
            throw UnsupportedFeatureError(compilation_.queryText,
                "Unsupported filter component " + node->toString());
        }
    }, node->node);
}

void PredicateCompiler::addComparison(const std::vector<std::string>& path, Operator op, const Value& operand,
                                      FilterSet& out) const {
    const auto& queryText = compilation_.queryText;
    ResolvedMember resolved = resolver_.resolve(path);
    const auto& member = *resolved.member;

    if (member.isRelation()) {
        addRelationComparison(member, op, operand, out);
        return;
    }

    if (member.parentKey) {
        if (op != Operator::Eq) {
            throw UnsupportedFeatureError(queryText,
                "The datastore only supports parent queries using the equality operator.");
        }
        if (operand.isNull()) {
            throw UnsupportedFeatureError(queryText,
                "Received a null parent parameter. The datastore does not support parent queries against null.");
        }
        Key ancestor = parentKey(operand);
        if (out.ancestor && *out.ancestor != ancestor) {
            throw UnsupportedFeatureError(queryText, "Only one parent constraint is supported.");
        }
        out.ancestor = std::move(ancestor);
        return;
    }

    if (op == Operator::Neq) {
        if (!operand.isNull()) {
            throw UnsupportedOperatorError(queryText, Operator::Neq);
        }
        // null sorts lowest, so "> null" selects every non-null value
        std::string property = member.primaryKey ? std::string(kKeyProperty) : resolved.propertyName;
        out.filters.push_back(NativeFilter{property, FilterOperator::GreaterThan, std::monostate{}});
        return;
    }

    auto nativeOp = nativeOperatorFor(op);
    if (!nativeOp) {
        throw UnsupportedOperatorError(queryText, op);
    }

    if (member.primaryKey) {
        if (operand.isList()) {
            throw QueryValidationError(queryText,
                "Batch lookup by primary key requires the equality operator, found " + std::string(operatorName(op)));
        }
        out.filters.push_back(NativeFilter{kKeyProperty, *nativeOp, coercer_.toKey(operand)});
        return;
    }

    out.filters.push_back(NativeFilter{resolved.propertyName, *nativeOp, coercer_.toProperty(operand, member)});
}

void PredicateCompiler::addRelationComparison(const schema::MemberMetadata& member, Operator op,
                                              const Value& operand, FilterSet& out) const {
    const auto& queryText = compilation_.queryText;
    std::optional<Key> related;
    if (!operand.isNull()) {
        related = ValueCoercer(member.relatedKind, queryText).toKey(operand);
        if (related->kind() != member.relatedKind) {
            throw QueryValidationError(queryText, "Field " + cls_.typeName + "." + member.name + " maps to kind " +
                                                      member.relatedKind + " but parameter value contains Key of kind " +
                                                      related->kind());
        }
    }

    if (member.relatedIsParent) {
        if (!related) {
            throw QueryValidationError(queryText, "Cannot query for objects with null parents.");
        }
        if (op != Operator::Eq) {
            throw UnsupportedFeatureError(queryText,
                "The datastore only supports parent queries using the equality operator.");
        }
        if (out.ancestor && *out.ancestor != *related) {
            throw UnsupportedFeatureError(queryText, "Only one parent constraint is supported.");
        }
        out.ancestor = std::move(*related);
        return;
    }

    // Owning side: the related record is a child, so its parent is the record sought
    if (op != Operator::Eq) {
        throw UnsupportedFeatureError(queryText,
            "Only the equals operator is supported on conditions involving the owning side of a one-to-one.");
    }
    if (!related) {
        throw QueryValidationError(queryText, "Cannot query for parents with null children.");
    }
    auto owner = related->parent();
    if (!owner) {
        throw QueryValidationError(queryText, "Key of parameter value does not have a parent.");
    }
    out.filters.push_back(NativeFilter{kKeyProperty, FilterOperator::Equal, std::move(*owner)});
}

void PredicateCompiler::addMethodCall(const MethodCall& call, FilterSet& out) const {
    const auto& queryText = compilation_.queryText;
    const auto* receiver = asIdentifier(call.receiver);

    if (call.name == "contains" && call.args.size() == 1) {
        if (receiver && !isValueNode(call.receiver)) {
            addComparison(receiver->path, Operator::Eq, operandValue(call.args[0]), out);
            return;
        }
        if (const auto* arg = asIdentifier(call.args[0]); arg && isValueNode(call.receiver)) {
            addComparison(arg->path, Operator::Eq, operandValue(call.receiver), out);
            return;
        }
    } else if ((call.name == "startsWith" || call.name == "matches") && call.args.size() == 1 && receiver) {
        const auto& arg = call.args[0];
        if (!isValueNode(arg)) {
            throw UnsupportedFeatureError(queryText,
                "Unsupported argument to " + call.name + ": " + arg->toString());
        }
        Value value = operandValue(arg);
        if (const auto* c = value.getIf<char>()) {
            value = Value(std::string(1, *c));
        }
        const auto* text = value.getIf<std::string>();
        if (!text) {
            throw QueryValidationError(queryText, "Prefix matching only supported on strings (received " +
                                                      value.toString() + ").");
        }
        if (call.name == "startsWith") {
            addPrefixFilters(receiver->path, *text, out);
            return;
        }

        std::string prefix;
        bool trailingWildcard = false;
        if (text->size() >= 2 && text->compare(text->size() - 2, 2, ".*") == 0) {
            prefix = text->substr(0, text->size() - 2);
            trailingWildcard = true;
        } else if (!text->empty() && text->back() == '%') {
            prefix = text->substr(0, text->size() - 1);
            trailingWildcard = true;
        }
        if (!trailingWildcard || prefix.find('%') != std::string::npos ||
            prefix.find(".*") != std::string::npos) {
            throw UnsupportedFeatureError(queryText,
                "Wildcard must appear at the end of the expression string (only prefix matches are supported).");
        }
        addPrefixFilters(receiver->path, prefix, out);
        return;
    }

    throw UnsupportedFeatureError(queryText, "Unsupported method <" + call.name + "> in filter.");
}

void PredicateCompiler::addPrefixFilters(const std::vector<std::string>& path, const std::string& prefix,
                                         FilterSet& out) const {
    ResolvedMember resolved = resolver_.resolve(path);
    if (resolved.member->parentKey || resolved.member->primaryKey || resolved.member->isRelation()) {
        throw UnsupportedFeatureError(compilation_.queryText,
            "Prefix matching is not supported on key member " + resolved.member->name + ".");
    }
    out.filters.push_back(NativeFilter{resolved.propertyName, FilterOperator::GreaterThanOrEqual, prefix});
    if (auto upper = prefixUpperBound(prefix)) {
        out.filters.push_back(NativeFilter{resolved.propertyName, FilterOperator::LessThan, *upper});
    }
}

// ---------------------------------------------------------------------------
// Operand evaluation
// ---------------------------------------------------------------------------

Value PredicateCompiler::operandValue(const NodePtr& node) const {
    const auto& queryText = compilation_.queryText;
    if (!node) {
        throw UnsupportedFeatureError(queryText, "Right side of expression is composed of unsupported components.");
    }
    return std::visit(overloaded{
        [&](const Literal& l) -> Value { return l.value; },
        [&](const Parameter& p) -> Value { return parameterValue(p); },
        [&](const Identifier& id) -> Value {
            if (isCurrentTimeConstant(id.path)) {
                return Value(clock_());
            }
            if (id.path.size() == 1 && id.path.front() == "CURRENT_TIME") {
                throw UnsupportedFeatureError(queryText,
                    "CURRENT_TIME is not supported because the store has no time-of-day type.");
            }
            // Implicit parameter
            if (id.path.size() == 1) {
                if (auto v = params_.lookup(id.path.front())) {
                    return *v;
                }
            }
            throw UnsupportedFeatureError(queryText,
                "Right side of expression is composed of unsupported components: " + node->toString());
        },
        [&](const UnaryExpr& u) -> Value {
            if (u.op == Operator::Neg && u.operand) {
                if (const auto* lit = std::get_if<Literal>(&u.operand->node)) {
                    return negate(lit->value);
                }
            }
            throw UnsupportedFeatureError(queryText,
                "Right side of expression is of unexpected type: " + node->toString());
        },
        [&](const auto&) -> Value {
            throw UnsupportedFeatureError(queryText,
                "Right side of expression is composed of unsupported components: " + node->toString());
        }
    }, node->node);
}

Value PredicateCompiler::parameterValue(const Parameter& p) const {
    if (auto v = params_.lookup(p)) {
        return *v;
    }
    std::string label = p.position ? "?" + std::to_string(*p.position) : ":" + p.name;
    throw QueryValidationError(compilation_.queryText, "No value bound for parameter " + label);
}

Value PredicateCompiler::negate(const Value& v) const {
    if (const auto* d = v.getIf<Decimal>()) {
        return Value(-coercer_.decimalToDouble(*d));
    }
    if (const auto* d = v.getIf<double>()) {
        return Value(-*d);
    }
    if (const auto* i = v.getIf<int64_t>()) {
        if (*i == std::numeric_limits<int64_t>::min()) {
            throw QueryValidationError(compilation_.queryText,
                "Negation of " + v.toString() + " is out of range for a 64-bit integer.");
        }
        return Value(-*i);
    }
    throw UnsupportedFeatureError(compilation_.queryText,
        "Right side of expression is of unexpected type: -" + v.toString());
}

Key PredicateCompiler::parentKey(const Value& v) const {
    if (const auto* k = v.getIf<Key>()) {
        return *k;
    }
    if (const auto* s = v.getIf<std::string>()) {
        if (auto decoded = Key::fromString(*s)) {
            return *decoded;
        }
    }
    throw QueryValidationError(compilation_.queryText,
        "Parent value " + v.toString() + " is not a key.");
}

} // namespace query
} // namespace quarry
