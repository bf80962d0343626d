#include <gtest/gtest.h>
#include "geocluster/cluster.hpp"
#include "geocluster/cohesion.hpp"
#include "geocluster/geodesy.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <vector>

using namespace geocluster;
using geocluster::testing::expect_centroids_consistent;
using geocluster::testing::expect_dense_ids;
using geocluster::testing::expect_exact_cover;
using geocluster::testing::pt;

namespace {

bool contains(const Cluster& c, size_t idx) {
    return std::find(c.members.begin(), c.members.end(), idx) != c.members.end();
}

}  // namespace

TEST(Cohesion, OppositeSidesOfHomeSplitByBearing) {
    // Four sites 20 miles out on bearings 0, 30, 180, 210. The centroid sits
    // on top of home so nothing looks stretched, but the span is 150 degrees.
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (double b : {0.0, 30.0, 180.0, 210.0}) arena.push_back(destination_point(home, b, 20.0));

    std::vector<Cluster> in = {make_cluster(arena, all_members(4), 0)};
    EXPECT_EQ(classify_cohesion(arena, in[0], home), CohesionVerdict::SplitByBearing);

    auto out = validate_cohesion(arena, in, home);
    ASSERT_EQ(out.size(), 2u);
    expect_exact_cover(out, arena.size());
    expect_dense_ids(out);
    expect_centroids_consistent(arena, out);

    // Midpoint bearing 105: 30 and 180 are within 90 of it, 0 and 210 are not.
    EXPECT_TRUE(contains(out[0], 1));
    EXPECT_TRUE(contains(out[0], 2));
    EXPECT_TRUE(contains(out[1], 0));
    EXPECT_TRUE(contains(out[1], 3));
}

TEST(Cohesion, OutlierSplitsStretchedCluster) {
    std::vector<GeoPoint> arena;
    for (int i = 0; i < 9; ++i) arena.push_back(pt(0.001 * i, 0.0005 * (i % 3)));
    arena.push_back(destination_point(pt(0.004, 0.0005), 45.0, 100.0));

    GeoPoint home = pt(0, 0);
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()), 0)};
    EXPECT_EQ(classify_cohesion(arena, in[0], home), CohesionVerdict::Stretched);

    auto out = validate_cohesion(arena, in, home);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].size(), 5u);
    EXPECT_EQ(out[1].size(), 5u);
    EXPECT_TRUE(contains(out[1], 9)) << "outlier belongs to the far half";
    expect_exact_cover(out, arena.size());
    expect_centroids_consistent(arena, out);
}

TEST(Cohesion, CompactClusterPassesThrough) {
    GeoPoint home = pt(31.0, -102.0);
    std::vector<GeoPoint> arena;
    for (int i = 0; i < 6; ++i)
        arena.push_back(destination_point(home, 40.0 + 4.0 * i, 30.0 + (i % 2)));

    Cluster c = make_cluster(arena, all_members(arena.size()), 7);
    EXPECT_EQ(classify_cohesion(arena, c, home), CohesionVerdict::Cohesive);

    auto out = validate_cohesion(arena, {c}, home);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].id, 0);
    EXPECT_EQ(out[0].members, c.members);
}

TEST(Cohesion, ValidatedSetIsStable) {
    // Splits first, then a second pass over the result must change nothing.
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (double b : {0.0, 30.0, 180.0, 210.0}) arena.push_back(destination_point(home, b, 20.0));
    for (int i = 0; i < 5; ++i) arena.push_back(destination_point(home, 90.0 + i, 40.0));
    std::vector<Cluster> in = {make_cluster(arena, {0, 1, 2, 3}, 0),
                               make_cluster(arena, {4, 5, 6, 7, 8}, 1)};

    auto once = validate_cohesion(arena, in, home);
    ASSERT_EQ(once.size(), 3u);
    auto twice = validate_cohesion(arena, once, home);
    ASSERT_EQ(twice.size(), once.size());
    for (size_t i = 0; i < once.size(); ++i) {
        EXPECT_EQ(twice[i].id, once[i].id);
        EXPECT_EQ(twice[i].members, once[i].members);
        EXPECT_DOUBLE_EQ(twice[i].centroid.latitude, once[i].centroid.latitude);
        EXPECT_DOUBLE_EQ(twice[i].centroid.longitude, once[i].centroid.longitude);
    }
}

TEST(Cohesion, SingletonIsAlwaysCohesive) {
    std::vector<GeoPoint> arena = {pt(10, 10)};
    Cluster c = make_cluster(arena, {0});
    EXPECT_EQ(classify_cohesion(arena, c, pt(-10, -10)), CohesionVerdict::Cohesive);
}

TEST(Cohesion, SpanMeasuredAcrossNorth) {
    // Bearings 350 and 10 are 20 degrees apart, not 340.
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena = {destination_point(home, 350.0, 20.0),
                                   destination_point(home, 10.0, 20.0)};
    Cluster c = make_cluster(arena, {0, 1});
    EXPECT_EQ(classify_cohesion(arena, c, home), CohesionVerdict::Cohesive);
}

TEST(Cohesion, ThresholdsComeFromConfig) {
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (double b : {10.0, 50.0, 90.0}) arena.push_back(destination_point(home, b, 25.0));
    Cluster c = make_cluster(arena, all_members(arena.size()));

    ClusterConfig cfg;
    EXPECT_EQ(classify_cohesion(arena, c, home, cfg), CohesionVerdict::Cohesive);
    cfg.max_bearing_span_deg = 60.0;
    EXPECT_EQ(classify_cohesion(arena, c, home, cfg), CohesionVerdict::SplitByBearing);
}

TEST(Cohesion, SinglePassOnly) {
    // The far half {10, 200} still spans 170 degrees; it is not revisited.
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (double b : {10.0, 60.0, 110.0, 160.0, 200.0})
        arena.push_back(destination_point(home, b, 20.0));
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()))};
    auto out = validate_cohesion(arena, in, home);
    ASSERT_EQ(out.size(), 2u);
    expect_exact_cover(out, arena.size());
    EXPECT_EQ(out[0].size(), 3u);
    EXPECT_EQ(classify_cohesion(arena, out[1], home), CohesionVerdict::SplitByBearing);
}
