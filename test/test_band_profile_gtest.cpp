/**
 * Unit tests for the float band profile
 *
 * Tests cover:
 * - Initial single band [0, inf)
 * - Structural splits
 * - Extent updates (max semantics) and eager merging
 * - Span queries: max_combined_extent, max_extent, scan
 * - Band count bound under random updates
 */

#include <gtest/gtest.h>
#include <vector>
#include <random>
#include <cmath>

extern "C" {
#include "../lib/log.h"
}
#include "../drift/band_profile.hpp"

using namespace drift;

class BandProfileTest : public ::testing::Test {
protected:
    BandProfile profile;

    void SetUp() override {
        log_init(NULL);
    }

    std::vector<Band> bands() {
        std::vector<Band> result;
        profile.foreach_band([&](const Band& band) {
            result.push_back(band);
            return true;
        });
        return result;
    }

    void expect_band(const Band& band, float top, float bottom, float left, float right) {
        EXPECT_EQ(band.top, top);
        EXPECT_EQ(band.bottom, bottom);
        EXPECT_EQ(band.extents.left, left);
        EXPECT_EQ(band.extents.right, right);
    }
};

// ============================================================================
// Construction and Splits
// ============================================================================

TEST_F(BandProfileTest, StartsAsSingleEmptyBand) {
    EXPECT_EQ(profile.band_count(), 1u);
    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 1u);
    expect_band(all[0], 0, INFINITY, 0, 0);
    EXPECT_TRUE(all[0].is_last());
    EXPECT_TRUE(profile.validate());
}

TEST_F(BandProfileTest, SplitKeepsExtents) {
    profile.set_extent(0, 50, FloatSide::Left, 30);
    ASSERT_EQ(profile.band_count(), 2u);

    profile.split_at(20);
    ASSERT_EQ(profile.band_count(), 3u);
    std::vector<Band> all = bands();
    expect_band(all[0], 0, 20, 30, 0);
    expect_band(all[1], 20, 50, 30, 0);
    expect_band(all[2], 50, INFINITY, 0, 0);

    // existing boundary and +inf are no-ops
    profile.split_at(20);
    profile.split_at(INFINITY);
    EXPECT_EQ(profile.band_count(), 3u);
}

TEST_F(BandProfileTest, BandAtFindsContainingBand) {
    profile.set_extent(10, 30, FloatSide::Right, 25);
    Band band = profile.band_at(15);
    expect_band(band, 10, 30, 0, 25);
    expect_band(profile.band_at(10), 10, 30, 0, 25);
    expect_band(profile.band_at(30), 30, INFINITY, 0, 0);
    expect_band(profile.band_at(0), 0, 10, 0, 0);
    EXPECT_EQ(profile.extent_at(29.5f, FloatSide::Right), 25);
    EXPECT_EQ(profile.extent_at(29.5f, FloatSide::Left), 0);
}

// ============================================================================
// Extent Updates and Merging
// ============================================================================

TEST_F(BandProfileTest, SetExtentSplitsUnalignedRange) {
    profile.set_extent(10, 30, FloatSide::Left, 40);
    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 3u);
    expect_band(all[0], 0, 10, 0, 0);
    expect_band(all[1], 10, 30, 40, 0);
    expect_band(all[2], 30, INFINITY, 0, 0);
    EXPECT_TRUE(profile.validate());
}

TEST_F(BandProfileTest, ExtentsOnlyGrow) {
    profile.set_extent(0, 40, FloatSide::Left, 50);
    profile.set_extent(20, 60, FloatSide::Left, 30);

    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 3u);
    expect_band(all[0], 0, 40, 50, 0);   // 30 does not lower 50
    expect_band(all[1], 40, 60, 30, 0);
    expect_band(all[2], 60, INFINITY, 0, 0);
    EXPECT_TRUE(profile.validate());
}

TEST_F(BandProfileTest, AdjacentEqualBandsMerge) {
    profile.set_extent(0, 20, FloatSide::Left, 40);
    profile.set_extent(20, 40, FloatSide::Left, 40);

    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 2u);
    expect_band(all[0], 0, 40, 40, 0);
    expect_band(all[1], 40, INFINITY, 0, 0);
    EXPECT_TRUE(profile.validate());
}

TEST_F(BandProfileTest, FillingAGapMergesBothNeighbours) {
    profile.set_extent(0, 10, FloatSide::Right, 15);
    profile.set_extent(20, 30, FloatSide::Right, 15);
    EXPECT_EQ(profile.band_count(), 4u);

    profile.set_extent(10, 20, FloatSide::Right, 15);
    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 2u);
    expect_band(all[0], 0, 30, 0, 15);
    EXPECT_TRUE(profile.validate());
}

TEST_F(BandProfileTest, SidesAreIndependent) {
    profile.set_extent(0, 30, FloatSide::Left, 20);
    profile.set_extent(10, 40, FloatSide::Right, 35);

    std::vector<Band> all = bands();
    ASSERT_EQ(all.size(), 4u);
    expect_band(all[0], 0, 10, 20, 0);
    expect_band(all[1], 10, 30, 20, 35);
    expect_band(all[2], 30, 40, 0, 35);
    expect_band(all[3], 40, INFINITY, 0, 0);
}

TEST_F(BandProfileTest, EmptyRangeIsIgnored) {
    profile.set_extent(10, 10, FloatSide::Left, 40);
    profile.set_extent(30, 20, FloatSide::Left, 40);
    EXPECT_EQ(profile.band_count(), 1u);
}

// ============================================================================
// Span Queries
// ============================================================================

TEST_F(BandProfileTest, MaxCombinedExtent) {
    profile.set_extent(0, 20, FloatSide::Left, 40);
    profile.set_extent(10, 30, FloatSide::Right, 30);
    profile.set_extent(50, 60, FloatSide::Left, 90);

    EXPECT_EQ(profile.max_combined_extent(0, 10), 40);
    EXPECT_EQ(profile.max_combined_extent(0, 30), 70);     // [10, 20) has both
    EXPECT_EQ(profile.max_combined_extent(20, 30), 30);
    EXPECT_EQ(profile.max_combined_extent(30, 50), 0);     // half-open: [50, 60) excluded
    EXPECT_EQ(profile.max_combined_extent(30, 50.5f), 90);
    EXPECT_EQ(profile.max_combined_extent(60, 1000), 0);
    EXPECT_EQ(profile.max_combined_extent(15, 15), 70);    // empty range: band at top
}

TEST_F(BandProfileTest, MaxExtentPerSide) {
    profile.set_extent(0, 20, FloatSide::Left, 40);
    profile.set_extent(20, 25, FloatSide::Left, 60);
    profile.set_extent(5, 15, FloatSide::Right, 10);

    EXPECT_EQ(profile.max_extent(0, 30, FloatSide::Left), 60);
    EXPECT_EQ(profile.max_extent(0, 20, FloatSide::Left), 40);
    EXPECT_EQ(profile.max_extent(0, 30, FloatSide::Right), 10);
    EXPECT_EQ(profile.max_extent(15, 30, FloatSide::Right), 0);
}

TEST_F(BandProfileTest, ScanReportsLastBandAtEachMaximum) {
    profile.set_extent(0, 10, FloatSide::Left, 40);
    profile.set_extent(10, 20, FloatSide::Left, 20);
    profile.set_extent(20, 30, FloatSide::Left, 40);
    profile.set_extent(5, 25, FloatSide::Right, 30);

    BandSpan span = profile.scan(0, 28);
    EXPECT_EQ(span.max_left, 40);
    EXPECT_EQ(span.max_right, 30);
    EXPECT_EQ(span.max_combined, 70);
    EXPECT_EQ(span.left_clear_y, 30);    // second band at 40 ends at 30
    EXPECT_EQ(span.right_clear_y, 25);
    EXPECT_EQ(span.band_count, 5);       // [0,5) [5,10) [10,20) [20,25) [25,30)
    EXPECT_EQ(span.max_extent(FloatSide::Left), 40);
}

TEST_F(BandProfileTest, ScanOfEmptyProfileReachesInfinity) {
    BandSpan span = profile.scan(100, 200);
    EXPECT_EQ(span.max_left, 0);
    EXPECT_EQ(span.max_right, 0);
    EXPECT_EQ(span.band_count, 1);
    EXPECT_TRUE(std::isinf(span.left_clear_y));
}

// ============================================================================
// Invariants Under Random Updates
// ============================================================================

TEST_F(BandProfileTest, RandomUpdatesKeepInvariants) {
    std::mt19937 g(2024);
    std::uniform_int_distribution<int> y_dist(0, 400);
    std::uniform_int_distribution<int> h_dist(1, 60);
    std::uniform_int_distribution<int> v_dist(1, 8);

    // reference: per unit row, the max value set on each side
    std::vector<float> ref_left(500, 0), ref_right(500, 0);

    const int updates = 300;
    for (int i = 0; i < updates; i++) {
        int top = y_dist(g);
        int bottom = top + h_dist(g);
        FloatSide side = (i % 3 == 0) ? FloatSide::Right : FloatSide::Left;
        float value = (float)(v_dist(g) * 10);

        profile.set_extent((float)top, (float)bottom, side, value);
        std::vector<float>& ref = side == FloatSide::Left ? ref_left : ref_right;
        for (int y = top; y < bottom; y++) {
            if (ref[y] < value) ref[y] = value;
        }

        ASSERT_TRUE(profile.validate()) << "after update " << i;
        ASSERT_LE(profile.band_count(), (size_t)(2 * (i + 1) + 1));
    }

    for (int y = 0; y < 500; y++) {
        Band band = profile.band_at(y + 0.5f);
        ASSERT_EQ(band.extents.left, ref_left[y]) << "y=" << y;
        ASSERT_EQ(band.extents.right, ref_right[y]) << "y=" << y;
    }
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
