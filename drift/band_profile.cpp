/**
 * BandProfile Implementation
 *
 * Band boundaries are splay tree keys, so a placement search that walks
 * down from the previous float starts next to the current root and the
 * lookups stay cheap.
 */

#include "band_profile.hpp"
#include "../lib/log.h"
#include <vector>

namespace drift {

BandProfile::BandProfile() {
    BandExtents zero = {0, 0};
    tree_.insert(0, zero);
}

BandProfile::NodeId BandProfile::first_node() const {
    NodeId id = tree_.root();
    if (id == Tree::NIL) return id;
    while (tree_.node(id).left != Tree::NIL) {
        id = tree_.node(id).left;
    }
    return id;
}

Band BandProfile::make_band(NodeId id, NodeId next) const {
    Band band;
    band.top = tree_.key(id);
    band.bottom = next == Tree::NIL ? INFINITY : tree_.key(next);
    band.extents = tree_.value(id);
    return band;
}

void BandProfile::split_at(float y) {
    if (std::isinf(y)) return;

    NodeId containing = tree_.find_boundary(y);
    if (containing == Tree::NIL || tree_.key(containing) == y) return;

    // copy first: insert may grow the node arena
    BandExtents extents = tree_.value(containing);
    tree_.insert(y, extents);
}

void BandProfile::set_extent(float top, float bottom, FloatSide side, float value) {
    if (!(bottom > top)) return;

    split_at(top);
    split_at(bottom);

    for (NodeId id = tree_.find(top); id != Tree::NIL && tree_.key(id) < bottom;
         id = tree_.next(id)) {
        BandExtents& extents = tree_.value(id);
        if (extents.get(side) < value) {
            extents.set(side, value);
        }
    }

    merge_equal_bands(top, bottom);
}

/**
 * Remove boundaries between equal neighbours, from the band above `from`
 * down to (and including) the band starting at `to`.
 */
void BandProfile::merge_equal_bands(float from, float to) {
    NodeId start = tree_.predecessor(from);
    if (start == Tree::NIL) {
        start = tree_.find_boundary(from);
    }

    std::vector<float> doomed;
    NodeId kept = start;
    for (NodeId cur = tree_.next(start); cur != Tree::NIL && tree_.key(cur) <= to;
         cur = tree_.next(cur)) {
        if (tree_.value(cur) == tree_.value(kept)) {
            doomed.push_back(tree_.key(cur));
        } else {
            kept = cur;
        }
    }

    for (size_t i = 0; i < doomed.size(); i++) {
        tree_.remove(doomed[i]);
    }
    if (!doomed.empty()) {
        log_debug("[BAND] merged %d boundaries in [%.1f, %.1f], %d bands left",
                  (int)doomed.size(), from, to, (int)tree_.size());
    }
}

BandSpan BandProfile::scan(float top, float bottom) {
    BandSpan span;
    span.max_left = 0;
    span.max_right = 0;
    span.max_combined = 0;
    span.left_clear_y = top;
    span.right_clear_y = top;
    span.band_count = 0;

    NodeId id = tree_.find_boundary(top);
    if (id == Tree::NIL) {
        id = tree_.first();
    }

    while (id != Tree::NIL) {
        NodeId next = tree_.next(id);
        Band band = make_band(id, next);
        span.band_count++;

        // >= keeps the last band reaching the maximum
        if (band.extents.left >= span.max_left) {
            span.max_left = band.extents.left;
            span.left_clear_y = band.bottom;
        }
        if (band.extents.right >= span.max_right) {
            span.max_right = band.extents.right;
            span.right_clear_y = band.bottom;
        }
        if (band.extents.combined() > span.max_combined) {
            span.max_combined = band.extents.combined();
        }

        if (next == Tree::NIL || !(tree_.key(next) < bottom)) break;
        id = next;
    }
    return span;
}

float BandProfile::max_combined_extent(float top, float bottom) {
    return scan(top, bottom).max_combined;
}

float BandProfile::max_extent(float top, float bottom, FloatSide side) {
    return scan(top, bottom).max_extent(side);
}

Band BandProfile::band_at(float y) {
    NodeId id = tree_.find_boundary(y);
    if (id == Tree::NIL) {
        id = tree_.first();
    }
    return make_band(id, tree_.next(id));
}

float BandProfile::extent_at(float y, FloatSide side) {
    return band_at(y).extents.get(side);
}

bool BandProfile::validate() const {
    if (!tree_.validate()) {
        log_error("[BAND] validate: tree structure is inconsistent");
        return false;
    }
    NodeId id = first_node();
    if (id == Tree::NIL || tree_.key(id) != 0) {
        log_error("[BAND] validate: profile does not start at 0");
        return false;
    }

    bool valid = true;
    bool have_prev = false;
    Band prev = {0, 0, {0, 0}};
    foreach_band([&](const Band& band) {
        const BandExtents& e = band.extents;
        if (!std::isfinite(e.left) || !std::isfinite(e.right) || e.left < 0 || e.right < 0) {
            log_error("[BAND] validate: bad extents at %.1f: left=%.1f right=%.1f",
                      band.top, e.left, e.right);
            valid = false;
            return false;
        }
        if (have_prev && prev.extents == e) {
            log_error("[BAND] validate: unmerged neighbours at %.1f", band.top);
            valid = false;
            return false;
        }
        if (band.is_last() && (e.left != 0 || e.right != 0)) {
            log_error("[BAND] validate: last band at %.1f has nonzero extents", band.top);
            valid = false;
            return false;
        }
        prev = band;
        have_prev = true;
        return true;
    });
    return valid;
}

void BandProfile::dump() const {
    log_debug("[BAND] profile: %d bands", (int)tree_.size());
    foreach_band([](const Band& band) {
        log_debug("[BAND]   [%.1f, %.1f) left=%.1f right=%.1f",
                  band.top, band.bottom, band.extents.left, band.extents.right);
        return true;
    });
}

}  // namespace drift
