/**
 * Float Placement Search Implementation
 *
 * CSS 2.2 Section 9.5.1 - Float positioning rules
 */

#include "float_placement.hpp"
#include "../lib/log.h"
#include <cmath>

namespace drift {

FloatError validate_float_request(const FloatRequest& request, float containing_width) {
    if (!std::isfinite(request.width) || !std::isfinite(request.height) ||
        !std::isfinite(request.min_top) ||
        request.width < 0 || request.height < 0 || request.min_top < 0) {
        return FLOAT_ERROR_INVALID_DIMENSIONS;
    }
    if (!std::isfinite(request.min_top + request.height)) {
        return FLOAT_ERROR_INVALID_DIMENSIONS;
    }
    if (request.width > containing_width) {
        return FLOAT_ERROR_INVALID_WIDTH;
    }
    return FLOAT_ERROR_NONE;
}

/**
 * Horizontal position of the float given the widest intrusions of its span
 */
static float float_x(FloatSide side, float width, float max_left, float max_right,
                     float containing_width) {
    if (side == FloatSide::Left) {
        return fminf(max_left, containing_width - width);
    }
    return fmaxf(containing_width - max_right - width, 0.0f);
}

FloatProbe find_float_placement(BandProfile& profile, const FloatRequest& request,
                                float containing_width) {
    FloatProbe probe;
    probe.extent = 0;
    probe.iterations = 0;

    FloatError error = validate_float_request(request, containing_width);
    if (error != FLOAT_ERROR_NONE) {
        probe.placement = FloatPlacement::failure(error);
        return probe;
    }

    float y = request.min_top;

    // an empty span fits anywhere: stay at min_top
    if (request.height == 0) {
        Band band = profile.band_at(y);
        float x = float_x(request.side, request.width, band.extents.left,
                          band.extents.right, containing_width);
        probe.iterations = 1;
        probe.extent = band.extents.get(request.side) + request.width;
        probe.placement = FloatPlacement::success(x, y);
        return probe;
    }

    for (;;) {
        probe.iterations++;
        // the float's bottom must stay finite and distinct from its top in float
        float bottom = y + request.height;
        if (!std::isfinite(bottom) || !(bottom > y)) {
            log_warn("[FLOAT] %s float of height %.1f cannot be represented at y=%.1f",
                     float_side_name(request.side), request.height, y);
            probe.placement = FloatPlacement::failure(FLOAT_ERROR_INVALID_DIMENSIONS);
            return probe;
        }
        BandSpan span = profile.scan(y, bottom);

        if (span.max_left + span.max_right + request.width <= containing_width) {
            float x = float_x(request.side, request.width, span.max_left,
                              span.max_right, containing_width);
            probe.extent = span.max_extent(request.side) + request.width;
            probe.placement = FloatPlacement::success(x, y);
            return probe;
        }

        // Any top above the last band holding either maximum still has both
        // maxima in its span, so the next candidate is the nearer of the two.
        float next_y = fminf(span.left_clear_y, span.right_clear_y);
        if (!(next_y > y) || std::isinf(next_y)) {
            log_error("[FLOAT] search stuck at y=%.1f (next=%.1f) for %s %.1fx%.1f",
                      y, next_y, float_side_name(request.side), request.width, request.height);
            probe.placement = FloatPlacement::failure(FLOAT_ERROR_INTERNAL);
            return probe;
        }
        y = next_y;
    }
}

void commit_float_placement(BandProfile& profile, const FloatRequest& request,
                            const FloatProbe& probe) {
    if (!probe.placement.ok() || request.width == 0 || request.height == 0) {
        return;
    }
    float top = probe.placement.origin.y;
    profile.set_extent(top, top + request.height, request.side, probe.extent);
}

}  // namespace drift
