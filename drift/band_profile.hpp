#pragma once

/**
 * BandProfile - piecewise-constant float intrusion profile of a BFC
 *
 * The half-line [0, +inf) is partitioned into maximal bands. Each band
 * records how far left floats intrude from the left content edge and how
 * far right floats intrude from the right content edge:
 *
 *   y=0   +------+-----------------+---+   band [0, 20):  left 40, right 30
 *         |      |                 |   |
 *   y=20  +------+-+---------------+---+   band [20, 35): left 55, right 0
 *         |        |                   |
 *   y=35  +--------+-------------------+   band [35, inf): left 0, right 0
 *
 * Band tops are the keys of a SplayTree, the extents its payload; a band's
 * bottom is the next key, or +inf for the last band. Adjacent bands never
 * carry equal extents: set_extent() merges them eagerly, so the band count
 * stays bounded by the number of distinct float edges (at most 2n + 1).
 */

#include "float_types.hpp"
#include "splay_tree.hpp"
#include <cmath>

namespace drift {

/**
 * Horizontal intrusion of both sides over one band
 */
struct BandExtents {
    float left;
    float right;

    float get(FloatSide side) const { return side == FloatSide::Left ? left : right; }
    void set(FloatSide side, float value) {
        if (side == FloatSide::Left) left = value;
        else right = value;
    }
    float combined() const { return left + right; }

    bool operator==(const BandExtents& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const BandExtents& other) const { return !(*this == other); }
};

/**
 * A resolved band [top, bottom) with its extents
 */
struct Band {
    float top;
    float bottom;   // INFINITY for the last band
    BandExtents extents;

    bool is_last() const { return std::isinf(bottom); }
};

/**
 * Summary of the bands intersecting a span, see BandProfile::scan()
 */
struct BandSpan {
    float max_left;          // widest left intrusion in the span
    float max_right;         // widest right intrusion in the span
    float max_combined;      // max over bands of left + right
    float left_clear_y;      // bottom of the last band reaching max_left
    float right_clear_y;     // bottom of the last band reaching max_right
    int band_count;          // bands intersecting the span

    float max_extent(FloatSide side) const {
        return side == FloatSide::Left ? max_left : max_right;
    }
};

class BandProfile {
public:
    typedef SplayTree<BandExtents> Tree;
    typedef Tree::NodeId NodeId;

    BandProfile();

    /**
     * Ensure a band boundary exists at y. The band containing y is split
     * into two bands with identical extents. No-op for y = +inf or when the
     * boundary already exists.
     */
    void split_at(float y);

    /**
     * Raise one side's extent to max(current, value) for every band inside
     * [top, bottom), then merge neighbouring bands left with equal extents.
     * Splits at top and bottom first, so the range need not be aligned.
     */
    void set_extent(float top, float bottom, FloatSide side, float value);

    /**
     * Max of left + right over bands intersecting [top, bottom).
     * An empty range (bottom <= top) reports the band containing top.
     */
    float max_combined_extent(float top, float bottom);

    /**
     * Max of one side's extent over bands intersecting [top, bottom).
     */
    float max_extent(float top, float bottom, FloatSide side);

    /**
     * Single pass over the bands intersecting [top, bottom), see BandSpan.
     */
    BandSpan scan(float top, float bottom);

    /**
     * The band containing y. The profile starts at 0: y < 0 reports the
     * first band.
     */
    Band band_at(float y);
    float extent_at(float y, FloatSide side);

    size_t band_count() const { return tree_.size(); }

    /**
     * Visit bands top to bottom without restructuring the tree.
     * fn(const Band&) returns false to stop.
     */
    template <typename Fn>
    void foreach_band(Fn fn) const {
        for (NodeId id = first_node(); id != Tree::NIL; ) {
            NodeId next = tree_.next(id);
            Band band = make_band(id, next);
            if (!fn(band)) break;
            id = next;
        }
    }

    /**
     * Check the partition: first band starts at 0, tops strictly increase,
     * extents are finite and non-negative, no two neighbours are equal,
     * the last band has zero extents, and the tree itself is consistent.
     */
    bool validate() const;

    void dump() const;

    const Tree& tree() const { return tree_; }

private:
    Band make_band(NodeId id, NodeId next) const;
    NodeId first_node() const;
    void merge_equal_bands(float from, float to);

    Tree tree_;
};

}  // namespace drift
