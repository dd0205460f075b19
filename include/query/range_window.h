#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace quarry {
namespace query {

/// Native offset/limit pair derived from a caller's [from, to) window.
struct RangeWindow {
    std::optional<int64_t> offset;
    std::optional<int64_t> limit;
    // Effective window is non-positive; no store call is needed
    bool empty = false;

    bool isSet() const { return offset.has_value() || limit.has_value(); }
    std::string toString() const;
};

/**
 * Computes the native window for an inclusive start and exclusive end.
 * A zero start is left unset, and the limit is the distance between the two
 * bounds once both are known. Throws std::invalid_argument on negative bounds.
 */
RangeWindow computeRangeWindow(std::optional<int64_t> fromInclusive, std::optional<int64_t> toExclusive);

} // namespace query
} // namespace quarry
