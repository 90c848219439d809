#pragma once
#include <algorithm>
#include <optional>
#include <string>
#include "core/GatewayError.h"

/**
 * @brief Bounds checks against the live cell count.
 *
 * Callers must pass a count read from the host in the same edit critical
 * section that later uses the indices; a cached count may be stale.
 * Violations throw INDEX_OUT_OF_BOUNDS carrying the attempted indices and the
 * observed count. Indices are taken as `long long` so that values outside
 * the `int` range are rejected as they were sent, never wrapped.
 */
class RangeValidator {
public:
    /** Half-open `[start, stop)`; requires 0 <= start < stop <= cellCount. */
    static void requireRange(long long start, long long stop, int cellCount, const std::string& operation) {
        if (start < 0 || start >= cellCount) {
            throw Errors::rangeOutOfBounds(start, stop, cellCount, operation);
        }
        if (stop <= start || stop > cellCount) {
            throw Errors::rangeOutOfBounds(start, stop, cellCount, operation);
        }
    }

    /** Requires 0 <= index < cellCount. */
    static void requireIndex(long long index, int cellCount, const std::string& operation) {
        if (index < 0 || index >= cellCount) {
            throw Errors::indexOutOfBounds(index, cellCount - 1, operation);
        }
    }

    /** Inserting never fails on position: it is clamped into [0, cellCount], default append. */
    static int clampInsertPosition(std::optional<long long> position, int cellCount) {
        if (!position.has_value()) return cellCount;
        return static_cast<int>(std::min<long long>(std::max<long long>(0, *position), cellCount));
    }
};
