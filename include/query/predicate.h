#pragma once

#include "query/value.h"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry {
namespace query {

/// Operators that can appear in an object-query expression tree.
enum class Operator {
    And,
    Or,
    Eq,
    Neq,
    Lt,
    Lte,
    Gt,
    Gte,
    Add,
    Sub,
    Mul,
    Div,
    Mod,
    Concat,
    Neg,
    Not,
    Com,
    Between,
    Is,
    IsNot,
    Like
};

const char* operatorName(Operator op);

struct PredicateNode;
using NodePtr = std::shared_ptr<const PredicateNode>;

struct Conjunction {
    NodePtr left;
    NodePtr right;
};

struct Disjunction {
    NodePtr left;
    NodePtr right;
};

// Binary operator other than AND/OR
struct Comparison {
    Operator op;
    NodePtr left;
    NodePtr right;
};

// Unary operator (negation, logical not, bitwise complement)
struct UnaryExpr {
    Operator op;
    NodePtr operand;
};

// receiver.name(args...); receiver may be null for static calls such as count()
struct MethodCall {
    std::string name;
    NodePtr receiver;
    std::vector<NodePtr> args;
};

// Dotted member path, e.g. {"p", "address", "city"}
struct Identifier {
    std::vector<std::string> path;
};

struct Literal {
    Value value;
};

// Named (":name") or positional ("?1") parameter
struct Parameter {
    std::string name;
    std::optional<int> position;
};

/**
 * Immutable expression node. The alternatives form a closed set; consumers
 * dispatch with std::visit.
 */
struct PredicateNode {
    using Variant = std::variant<
        Conjunction,
        Disjunction,
        Comparison,
        UnaryExpr,
        MethodCall,
        Identifier,
        Literal,
        Parameter
    >;

    Variant node;

    // Operator carried by this node, if any
    std::optional<Operator> op() const;
    std::string toString() const;
};

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Builders
NodePtr makeAnd(NodePtr left, NodePtr right);
NodePtr makeOr(NodePtr left, NodePtr right);
NodePtr makeComparison(Operator op, NodePtr left, NodePtr right);
NodePtr makeUnary(Operator op, NodePtr operand);
NodePtr makeCall(std::string name, NodePtr receiver, std::vector<NodePtr> args = {});
NodePtr makeIdentifier(std::vector<std::string> path);
NodePtr makeLiteral(Value value);
NodePtr makeParameter(std::string name);
NodePtr makeParameter(int position);

inline NodePtr makeEq(NodePtr left, NodePtr right) {
    return makeComparison(Operator::Eq, std::move(left), std::move(right));
}

} // namespace query
} // namespace quarry
