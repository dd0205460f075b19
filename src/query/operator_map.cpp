#include "query/operator_map.h"

namespace quarry {
namespace query {

bool isUnsupportedOperator(Operator op) {
    switch (op) {
        case Operator::Add:
        case Operator::Between:
        case Operator::Com:
        case Operator::Concat:
        case Operator::Div:
        case Operator::Is:
        case Operator::IsNot:
        case Operator::Like:
        case Operator::Mod:
        case Operator::Neg:
        case Operator::Mul:
        case Operator::Not:
        case Operator::Or:
        case Operator::Sub:
            return true;
        default:
            return false;
    }
}

std::optional<FilterOperator> nativeOperatorFor(Operator op) {
    switch (op) {
        case Operator::Eq: return FilterOperator::Equal;
        case Operator::Gt: return FilterOperator::GreaterThan;
        case Operator::Gte: return FilterOperator::GreaterThanOrEqual;
        case Operator::Lt: return FilterOperator::LessThan;
        case Operator::Lte: return FilterOperator::LessThanOrEqual;
        default: return std::nullopt;
    }
}

} // namespace query
} // namespace quarry
