/**
 * FloatContext Implementation
 *
 * CSS 2.2 Section 9.5.1 - Float positioning rules
 * CSS 2.2 Section 9.5.2 - Controlling flow next to floats: the 'clear' property
 */

#include "float_context.hpp"
#include "../lib/log.h"
#include <cassert>
#include <cmath>

namespace drift {

FloatContext::FloatContext(float containing_width) {
    init(FloatContextConfig::with_width(containing_width));
}

FloatContext::FloatContext(const FloatContextConfig& config) {
    init(config);
}

void FloatContext::init(const FloatContextConfig& config) {
    config_ = config;
    if (!(config_.containing_width >= 0) || std::isinf(config_.containing_width)) {
        log_warn("[FLOAT] invalid containing width %.1f, using 0", config_.containing_width);
        config_.containing_width = 0;
    }
    if (config_.max_floats < 0) {
        config_.max_floats = 0;
    }
    lowest_bottom_[0] = lowest_bottom_[1] = 0;
    side_count_[0] = side_count_[1] = 0;
    float_count_ = 0;

    log_debug("[FLOAT] Init: containing_width=%.1f, max_floats=%d",
              config_.containing_width, config_.max_floats);
}

FloatPlacement FloatContext::add_float(FloatSide side, float width, float height, float min_top) {
    FloatRequest request;
    request.side = side;
    request.width = width;
    request.height = height;
    request.min_top = min_top;
    return add_float(request);
}

FloatPlacement FloatContext::add_float(const FloatRequest& request) {
    if (config_.max_floats > 0 && float_count_ >= config_.max_floats) {
        log_warn("[FLOAT] rejected %s float: limit of %d floats reached",
                 float_side_name(request.side), config_.max_floats);
        return FloatPlacement::failure(FLOAT_ERROR_LIMIT_EXCEEDED);
    }

    FloatProbe probe = find_float_placement(profile_, request, config_.containing_width);
    if (!probe.placement.ok()) {
        log_warn("[FLOAT] rejected %s float %.1fx%.1f at min_top=%.1f: %s",
                 float_side_name(request.side), request.width, request.height,
                 request.min_top, float_error_name(probe.placement.error));
        return probe.placement;
    }

    commit_float_placement(profile_, request, probe);

    int index = side_index(request.side);
    float bottom = probe.placement.origin.y + request.height;
    if (bottom > lowest_bottom_[index]) {
        lowest_bottom_[index] = bottom;
    }
    side_count_[index]++;
    float_count_++;

    if (config_.log_placements) {
        log_debug("[FLOAT] Positioned %s float %.1fx%.1f (min_top=%.1f): (%.1f, %.1f), "
                  "%d tries, %d bands",
                  float_side_name(request.side), request.width, request.height,
                  request.min_top, probe.placement.origin.x, probe.placement.origin.y,
                  probe.iterations, (int)profile_.band_count());
    }
    if (config_.validate_invariants) {
        check_invariants();
    }
    return probe.placement;
}

FloatPlacement FloatContext::find_placement(FloatSide side, float width, float height,
                                            float min_top) {
    FloatRequest request;
    request.side = side;
    request.width = width;
    request.height = height;
    request.min_top = min_top;
    return find_float_placement(profile_, request, config_.containing_width).placement;
}

float FloatContext::available_width_at(float y) {
    // floats never extend above the formatting context's top
    if (y < 0) {
        return config_.containing_width;
    }
    Band band = profile_.band_at(y);
    float width = config_.containing_width - band.extents.left - band.extents.right;
    return width > 0 ? width : 0;
}

FloatAvailableSpace FloatContext::available_space(float y, float height) {
    FloatAvailableSpace space;
    if (y < 0 && !(y + height > 0)) {
        space.left = 0;
        space.right = config_.containing_width;
        return space;
    }
    BandSpan span = profile_.scan(y, y + height);
    space.left = span.max_left;
    space.right = config_.containing_width - span.max_right;
    if (space.right < space.left) {
        space.right = space.left;
    }

    log_debug("[FLOAT] space(%.1f, h=%.1f): left=%.1f, right=%.1f, width=%.1f",
              y, height, space.left, space.right, space.width());
    return space;
}

float FloatContext::available_width_in(float y, float height) {
    return available_space(y, height).width();
}

float FloatContext::clearance_y(ClearSide side) const {
    float clear_y = 0;
    if (side == ClearSide::Left || side == ClearSide::Both) {
        clear_y = fmaxf(clear_y, lowest_bottom_[0]);
    }
    if (side == ClearSide::Right || side == ClearSide::Both) {
        clear_y = fmaxf(clear_y, lowest_bottom_[1]);
    }
    return clear_y;
}

void FloatContext::check_invariants() {
    bool valid = profile_.validate();
    float containing_width = config_.containing_width;
    profile_.foreach_band([&](const Band& band) {
        if (band.extents.combined() > containing_width) {
            log_error("[FLOAT] band [%.1f, %.1f) intrudes %.1f into width %.1f",
                      band.top, band.bottom, band.extents.combined(), containing_width);
            valid = false;
            return false;
        }
        return true;
    });
    if (profile_.band_count() > static_cast<size_t>(2 * float_count_ + 1)) {
        log_error("[FLOAT] %d bands for %d floats", (int)profile_.band_count(), float_count_);
        valid = false;
    }
    if (!valid) {
        profile_.dump();
    }
    assert(valid && "float band profile invariant violated");
    (void)valid;
}

void FloatContext::dump() const {
    log_debug("[FLOAT] context: width=%.1f, floats=%d (left %d, right %d), "
              "clear left=%.1f right=%.1f",
              config_.containing_width, float_count_, side_count_[0], side_count_[1],
              lowest_bottom_[0], lowest_bottom_[1]);
    profile_.dump();
}

}  // namespace drift
