#include <gtest/gtest.h>
#include "geocluster/cluster.hpp"
#include "geocluster/data_generator.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/overload.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>

using namespace geocluster;
using geocluster::testing::expect_centroids_consistent;
using geocluster::testing::expect_dense_ids;
using geocluster::testing::expect_exact_cover;
using geocluster::testing::expect_within_capacity;
using geocluster::testing::pt;

TEST(Overload, SplitsLargeClusterUnderCap) {
    GeoPoint home = pt(35.0, -100.0);
    auto arena = generate_uniform_box(60, 35.2, -99.8, 0.8, 21);
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()), 0)};

    std::mt19937 rng(21);
    auto out = split_overloaded(arena, in, 8, home, 0.35, rng);

    EXPECT_GE(out.size(), 8u);
    expect_within_capacity(out, 8);
    expect_exact_cover(out, arena.size());
    expect_dense_ids(out);
    expect_centroids_consistent(arena, out);
}

TEST(Overload, CapacityHoldsWithBalancingOn) {
    GeoPoint home = pt(31.99, -102.07);
    auto arena = generate_facility_sites(150, home, 6, 80.0, 4.0, 5);
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()), 0)};

    std::mt19937 rng(5);
    auto out = split_overloaded(arena, in, 12, home, 0.9, rng);
    expect_within_capacity(out, 12);
    expect_exact_cover(out, arena.size());
    expect_dense_ids(out);
}

TEST(Overload, IdenticalLocationsFallBackToRuns) {
    std::vector<GeoPoint> arena(7, pt(33.0, -97.0));
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()), 0)};

    std::mt19937 rng(1);
    auto out = split_overloaded(arena, in, 3, pt(32.0, -97.0), 0.35, rng);

    ASSERT_EQ(out.size(), 3u);
    std::vector<size_t> sizes;
    for (const auto& c : out) sizes.push_back(c.size());
    std::sort(sizes.begin(), sizes.end());
    EXPECT_EQ(sizes, (std::vector<size_t>{1, 3, 3}));
    expect_exact_cover(out, arena.size());
}

TEST(Overload, ClustersWithinCapacityPassThrough) {
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (int i = 0; i < 4; ++i) arena.push_back(destination_point(home, 45.0 + i, 30.0));
    for (int i = 0; i < 3; ++i) arena.push_back(destination_point(home, 200.0 + i, 30.0));
    std::vector<Cluster> in = {make_cluster(arena, {0, 1, 2, 3}, 0),
                               make_cluster(arena, {4, 5, 6}, 1)};

    std::mt19937 rng(1);
    auto out = split_overloaded(arena, in, 5, home, 0.9, rng);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].members, in[0].members);
    EXPECT_EQ(out[1].members, in[1].members);
}

TEST(Overload, CohesionAppliedEvenWithoutOverload) {
    GeoPoint home = pt(0, 0);
    std::vector<GeoPoint> arena;
    for (double b : {0.0, 30.0, 180.0, 210.0}) arena.push_back(destination_point(home, b, 20.0));
    std::vector<Cluster> in = {make_cluster(arena, all_members(arena.size()), 0)};

    std::mt19937 rng(1);
    auto out = split_overloaded(arena, in, 10, home, 0.35, rng);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0].size(), 2u);
    EXPECT_EQ(out[1].size(), 2u);
    expect_exact_cover(out, arena.size());
}

TEST(Overload, RejectsZeroCapacity) {
    std::vector<GeoPoint> arena = {pt(0, 0)};
    std::vector<Cluster> in = {make_cluster(arena, {0}, 0)};
    std::mt19937 rng(1);
    EXPECT_THROW(split_overloaded(arena, in, 0, pt(0, 0), 0.35, rng), std::invalid_argument);
}
