#include "query/range_window.h"

#include <stdexcept>

namespace quarry {
namespace query {

std::string RangeWindow::toString() const {
    if (empty) return "RangeWindow(empty)";
    std::string out = "RangeWindow(offset=";
    out += offset ? std::to_string(*offset) : "none";
    out += ", limit=";
    out += limit ? std::to_string(*limit) : "none";
    return out + ")";
}

RangeWindow computeRangeWindow(std::optional<int64_t> fromInclusive, std::optional<int64_t> toExclusive) {
    if ((fromInclusive && *fromInclusive < 0) || (toExclusive && *toExclusive < 0)) {
        throw std::invalid_argument("Range bounds must be non-negative");
    }

    RangeWindow window;
    if (toExclusive && *toExclusive == 0) {
        window.empty = true;
        return window;
    }
    if (fromInclusive && toExclusive && *toExclusive - *fromInclusive <= 0) {
        window.empty = true;
        return window;
    }

    if (fromInclusive && *fromInclusive != 0) {
        window.offset = *fromInclusive;
    }
    if (toExclusive) {
        window.limit = *toExclusive - fromInclusive.value_or(0);
    }
    return window;
}

} // namespace query
} // namespace quarry
