#include "query/predicate.h"

namespace quarry {
namespace query {

const char* operatorName(Operator op) {
    switch (op) {
        case Operator::And: return "&&";
        case Operator::Or: return "||";
        case Operator::Eq: return "==";
        case Operator::Neq: return "!=";
        case Operator::Lt: return "<";
        case Operator::Lte: return "<=";
        case Operator::Gt: return ">";
        case Operator::Gte: return ">=";
        case Operator::Add: return "+";
        case Operator::Sub: return "-";
        case Operator::Mul: return "*";
        case Operator::Div: return "/";
        case Operator::Mod: return "%";
        case Operator::Concat: return "||(concat)";
        case Operator::Neg: return "-(negate)";
        case Operator::Not: return "!";
        case Operator::Com: return "~";
        case Operator::Between: return "BETWEEN";
        case Operator::Is: return "IS";
        case Operator::IsNot: return "IS NOT";
        case Operator::Like: return "LIKE";
    }
    return "?";
}

std::optional<Operator> PredicateNode::op() const {
    return std::visit(overloaded{
        [](const Conjunction&) -> std::optional<Operator> { return Operator::And; },
        [](const Disjunction&) -> std::optional<Operator> { return Operator::Or; },
        [](const Comparison& c) -> std::optional<Operator> { return c.op; },
        [](const UnaryExpr& u) -> std::optional<Operator> { return u.op; },
        [](const auto&) -> std::optional<Operator> { return std::nullopt; }
    }, node);
}

namespace {

std::string str(const NodePtr& n) {
    return n ? n->toString() : "null";
}

} // namespace

std::string PredicateNode::toString() const {
    return std::visit(overloaded{
        [](const Conjunction& c) { return "(" + str(c.left) + " && " + str(c.right) + ")"; },
        [](const Disjunction& d) { return "(" + str(d.left) + " || " + str(d.right) + ")"; },
        [](const Comparison& c) {
            return "(" + str(c.left) + " " + operatorName(c.op) + " " + str(c.right) + ")";
        },
        [](const UnaryExpr& u) { return std::string(operatorName(u.op)) + str(u.operand); },
        [](const MethodCall& m) {
            std::string out = m.receiver ? str(m.receiver) + "." : std::string();
            out += m.name + "(";
            for (size_t i = 0; i < m.args.size(); ++i) {
                if (i > 0) out += ", ";
                out += str(m.args[i]);
            }
            return out + ")";
        },
        [](const Identifier& id) {
            std::string out;
            for (size_t i = 0; i < id.path.size(); ++i) {
                if (i > 0) out += ".";
                out += id.path[i];
            }
            return out;
        },
        [](const Literal& l) { return l.value.toString(); },
        [](const Parameter& p) {
            return p.position ? "?" + std::to_string(*p.position) : ":" + p.name;
        }
    }, node);
}

NodePtr makeAnd(NodePtr left, NodePtr right) {
    return std::make_shared<const PredicateNode>(PredicateNode{Conjunction{std::move(left), std::move(right)}});
}

NodePtr makeOr(NodePtr left, NodePtr right) {
    return std::make_shared<const PredicateNode>(PredicateNode{Disjunction{std::move(left), std::move(right)}});
}

NodePtr makeComparison(Operator op, NodePtr left, NodePtr right) {
    return std::make_shared<const PredicateNode>(PredicateNode{Comparison{op, std::move(left), std::move(right)}});
}

NodePtr makeUnary(Operator op, NodePtr operand) {
    return std::make_shared<const PredicateNode>(PredicateNode{UnaryExpr{op, std::move(operand)}});
}

NodePtr makeCall(std::string name, NodePtr receiver, std::vector<NodePtr> args) {
    return std::make_shared<const PredicateNode>(
        PredicateNode{MethodCall{std::move(name), std::move(receiver), std::move(args)}});
}

NodePtr makeIdentifier(std::vector<std::string> path) {
    return std::make_shared<const PredicateNode>(PredicateNode{Identifier{std::move(path)}});
}

NodePtr makeLiteral(Value value) {
    return std::make_shared<const PredicateNode>(PredicateNode{Literal{std::move(value)}});
}

NodePtr makeParameter(std::string name) {
    return std::make_shared<const PredicateNode>(PredicateNode{Parameter{std::move(name), std::nullopt}});
}

NodePtr makeParameter(int position) {
    return std::make_shared<const PredicateNode>(PredicateNode{Parameter{std::string(), position}});
}

} // namespace query
} // namespace quarry
