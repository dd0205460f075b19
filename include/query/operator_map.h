#pragma once

#include "query/native_query.h"
#include "query/predicate.h"

#include <optional>

namespace quarry {
namespace query {

/// Operators the store has no counterpart for. They are rejected wherever
/// they occur in a tree, including inside branches that would be skipped.
bool isUnsupportedOperator(Operator op);

/// Native comparison for `op`; nullopt when none exists. Not-equal is not
/// mapped here: it is only meaningful against null and handled by the caller.
std::optional<FilterOperator> nativeOperatorFor(Operator op);

} // namespace query
} // namespace quarry
