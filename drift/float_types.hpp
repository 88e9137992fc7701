#pragma once

/**
 * Float Types - shared vocabulary of the float placement engine
 *
 * Sides, placement requests and results, and the error codes reported
 * by FloatContext. Coordinates are CSS pixels relative to the content
 * box of the block formatting context (x grows right, y grows down).
 */

#include <cstdint>

namespace drift {

enum class FloatSide : uint8_t {
    Left = 0,
    Right = 1
};

enum class ClearSide : uint8_t {
    Left = 0,
    Right = 1,
    Both = 2
};

inline FloatSide opposite(FloatSide side) {
    return side == FloatSide::Left ? FloatSide::Right : FloatSide::Left;
}

const char* float_side_name(FloatSide side);
const char* clear_side_name(ClearSide side);

// ============================================================================
// Error Codes
// ============================================================================

typedef enum FloatError {
    FLOAT_ERROR_NONE = 0,
    FLOAT_ERROR_INVALID_WIDTH,       // wider than the containing block
    FLOAT_ERROR_INVALID_DIMENSIONS,  // negative or non-finite width/height/min_top
    FLOAT_ERROR_LIMIT_EXCEEDED,      // FloatContextConfig::max_floats reached
    FLOAT_ERROR_INTERNAL,            // search failed to advance (invariant violation)
} FloatError;

/**
 * Get the short error name, e.g. "invalid-width"
 */
const char* float_error_name(FloatError error);

// ============================================================================
// Requests and Results
// ============================================================================

struct FloatPoint {
    float x;
    float y;
};

/**
 * A placement request as issued by the layout engine. The engine resolves
 * margins beforehand: width and height are the float's margin box.
 */
struct FloatRequest {
    FloatSide side;
    float width;
    float height;
    float min_top;   // float may not be placed above this y
};

struct FloatPlacement {
    FloatPoint origin;   // top-left of the margin box
    FloatError error;

    bool ok() const { return error == FLOAT_ERROR_NONE; }

    static FloatPlacement success(float x, float y) {
        FloatPlacement p;
        p.origin.x = x;
        p.origin.y = y;
        p.error = FLOAT_ERROR_NONE;
        return p;
    }

    static FloatPlacement failure(FloatError error) {
        FloatPlacement p;
        p.origin.x = 0;
        p.origin.y = 0;
        p.error = error;
        return p;
    }
};

/**
 * Horizontal space left free by floats, relative to the content box.
 */
struct FloatAvailableSpace {
    float left;    // left edge of available space
    float right;   // right edge of available space

    float width() const { return right > left ? right - left : 0; }
};

}  // namespace drift
