#include <gtest/gtest.h>
#include "geocluster/cluster.hpp"
#include "geocluster/merge.hpp"
#include "test_helpers.hpp"

#include <vector>

using namespace geocluster;
using geocluster::testing::expect_centroids_consistent;
using geocluster::testing::expect_dense_ids;
using geocluster::testing::expect_exact_cover;
using geocluster::testing::pt;

TEST(Merge, MeanIntraDistance) {
    std::vector<GeoPoint> arena = {pt(0, 0), pt(1, 0), pt(2, 0)};
    // Pairs: 1, 1 and 2 degrees of latitude.
    double one_deg = 69.0976;
    EXPECT_NEAR(mean_intra_distance(arena, make_cluster(arena, {0, 1, 2})),
                4.0 * one_deg / 3.0, 1e-2);
    EXPECT_DOUBLE_EQ(mean_intra_distance(arena, make_cluster(arena, {1})), 0.0);
}

TEST(Merge, NeighbouringSmallClustersCombine) {
    // A spans 0.01 deg; B's centroid is 0.0125 deg from A's, within twice the spread.
    std::vector<GeoPoint> arena = {pt(0, 0), pt(0, 0.01), pt(0, 0.015), pt(0, 0.025)};
    std::vector<Cluster> in = {make_cluster(arena, {0, 1}, 0), make_cluster(arena, {2, 3}, 1)};

    auto out = merge_adjacent(arena, in, 5, pt(0, 0));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].size(), 4u);
    expect_centroids_consistent(arena, out);
}

TEST(Merge, DistantClustersStayApart) {
    std::vector<GeoPoint> arena = {pt(0, 0), pt(0, 0.01), pt(1, 1), pt(1, 1.01)};
    std::vector<Cluster> in = {make_cluster(arena, {0, 1}, 0), make_cluster(arena, {2, 3}, 1)};

    auto out = merge_adjacent(arena, in, 5, pt(0, 0));
    ASSERT_EQ(out.size(), 2u);
}

TEST(Merge, NeverExceedsCapacity) {
    std::vector<GeoPoint> arena = {pt(0, 0), pt(0, 0.001), pt(0, 0.002)};
    std::vector<Cluster> in = {make_cluster(arena, {0}, 0), make_cluster(arena, {1}, 1),
                               make_cluster(arena, {2}, 2)};

    auto out = merge_adjacent(arena, in, 2, pt(0, 0));
    ASSERT_EQ(out.size(), 2u);
    for (const auto& c : out) EXPECT_LE(c.size(), 2u);
    expect_exact_cover(out, arena.size());
    expect_dense_ids(out);
}

TEST(Merge, ResultOrderedFromHome) {
    std::vector<GeoPoint> arena = {pt(5, 0), pt(0.1, 0)};
    std::vector<Cluster> in = {make_cluster(arena, {0}, 0), make_cluster(arena, {1}, 1)};

    // Capacity 1 rules out merging; only ordering applies.
    auto out = merge_adjacent(arena, in, 1, pt(0, 0));
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].members.front(), 1u);
    EXPECT_EQ(out[1].members.front(), 0u);
    expect_dense_ids(out);
}
