#pragma once

/**
 * FloatContext - float bookkeeping for one block formatting context
 *
 * The layout engine resolves each float's margin box, then asks the
 * context where it goes (add_float). Line layout asks how much width the
 * floats leave at a given y (available_width_at / available_space), and
 * block layout asks where `clear` lands (clearance_y).
 *
 * Coordinates are relative to the content box of the element that
 * establishes the BFC. One context per BFC; it lives for one layout pass.
 * Floats are only ever added.
 */

#include "float_types.hpp"
#include "band_profile.hpp"
#include "float_placement.hpp"

namespace drift {

struct FloatContextConfig {
    float containing_width;     // content box width of the BFC root
    int max_floats;             // reject floats beyond this count, 0 = unlimited
    bool validate_invariants;   // check the band profile after every commit
    bool log_placements;        // trace each placement at DEBUG level

    static FloatContextConfig defaults() {
        FloatContextConfig config;
        config.containing_width = 0;
        config.max_floats = 0;
        config.validate_invariants = false;
        config.log_placements = true;
        return config;
    }

    static FloatContextConfig with_width(float containing_width) {
        FloatContextConfig config = defaults();
        config.containing_width = containing_width;
        return config;
    }
};

class FloatContext {
public:
    explicit FloatContext(float containing_width);
    explicit FloatContext(const FloatContextConfig& config);

    // =====================================================
    // Float Management
    // =====================================================

    /**
     * Place a float and record it. On error nothing is recorded.
     * @param side      which edge the float is pushed toward
     * @param width     margin box width, 0 <= width <= containing_width
     * @param height    margin box height
     * @param min_top   the float may not be placed above this y
     */
    FloatPlacement add_float(FloatSide side, float width, float height, float min_top);
    FloatPlacement add_float(const FloatRequest& request);

    /**
     * Where add_float would place this float, without recording it.
     */
    FloatPlacement find_placement(FloatSide side, float width, float height, float min_top);

    // =====================================================
    // Space Queries
    // =====================================================

    /**
     * Width left free by floats at y: containing width minus both extents.
     * Above the context (y < 0) the full containing width is free.
     */
    float available_width_at(float y);

    /**
     * Free horizontal space over the whole of [y, y + height). A line box
     * must fit beside every float it overlaps, not only the one at its top.
     */
    FloatAvailableSpace available_space(float y, float height);

    /**
     * Width of available_space(y, height). A float intruding over only part
     * of the range still narrows the whole range.
     */
    float available_width_in(float y, float height);

    /**
     * Lowest bottom of the floats on the given side(s), 0 if none:
     * the y a box with `clear` must move down to.
     */
    float clearance_y(ClearSide side) const;

    // =====================================================
    // Utility
    // =====================================================

    float containing_width() const { return config_.containing_width; }
    int float_count() const { return float_count_; }
    int float_count(FloatSide side) const { return side_count_[side_index(side)]; }
    size_t band_count() const { return profile_.band_count(); }
    const FloatContextConfig& config() const { return config_; }
    const BandProfile& profile() const { return profile_; }

    void dump() const;

private:
    static int side_index(FloatSide side) { return side == FloatSide::Left ? 0 : 1; }
    void init(const FloatContextConfig& config);
    void check_invariants();

    FloatContextConfig config_;
    BandProfile profile_;
    float lowest_bottom_[2];
    int side_count_[2];
    int float_count_;
};

}  // namespace drift
