#pragma once

/**
 * Float Placement Search
 *
 * CSS 2.2 Section 9.5.1 rules for one float against the floats already
 * recorded in a BandProfile:
 * - the float sits to the right of every left float (left of every right
 *   float) whose span overlaps its own
 * - it is placed as high as possible, but not above min_top
 * - it is pushed as far toward its side as possible
 *
 * The search is split from the commit so a caller can probe where a
 * float would go without recording it.
 */

#include "band_profile.hpp"

namespace drift {

/**
 * Result of a placement search
 */
struct FloatProbe {
    FloatPlacement placement;
    float extent;      // the float's side extent once committed
    int iterations;    // candidate tops examined
};

/**
 * Check a request before any search or mutation.
 * @return FLOAT_ERROR_INVALID_DIMENSIONS for negative or non-finite values
 *         (min_top + height included), FLOAT_ERROR_INVALID_WIDTH when wider
 *         than the containing block
 */
FloatError validate_float_request(const FloatRequest& request, float containing_width);

/**
 * Find the highest feasible top for the float, starting at min_top and
 * skipping down past obstructing bands. Splays the profile's tree but
 * leaves the profile's content unchanged. Fails with
 * FLOAT_ERROR_INVALID_DIMENSIONS when the search reaches a top where
 * top + height is not finite or rounds back to top.
 */
FloatProbe find_float_placement(BandProfile& profile, const FloatRequest& request,
                                float containing_width);

/**
 * Record a successful probe in the profile. Zero-width and zero-height
 * floats occupy no area and leave the profile unchanged.
 */
void commit_float_placement(BandProfile& profile, const FloatRequest& request,
                            const FloatProbe& probe);

}  // namespace drift
