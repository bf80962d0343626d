#ifndef GEOCLUSTER_BALANCE_HPP
#define GEOCLUSTER_BALANCE_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/config.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

/**
 * Evens out cluster sizes by moving boundary points between neighbours.
 *
 * Below cfg.balance_threshold (0.6) this returns `clusters` untouched:
 * geography wins over even sizing. Otherwise clusters are ordered by
 * centroid distance from `home` and each adjacent pair (current, next) is
 * visited once. While current is above the mean size, next has room under
 * `max_points`, and current still outnumbers next by more than one, the
 * member of current nearest next's centroid moves across, provided it lies
 * within radius_expansion * (radius_percentile radius of next). The first
 * candidate that fails that test ends the pair.
 *
 * Points only ever move from the nearer cluster of a pair to the farther
 * one, and only between neighbours in the distance order. The returned list
 * is in that order and renumbered.
 */
std::vector<Cluster> balance(const std::vector<GeoPoint>& arena,
                             std::vector<Cluster> clusters, size_t max_points,
                             const GeoPoint& home, double balance_weight,
                             const ClusterConfig& cfg = {});

// Stable ascending sort by centroid distance from `home`, then renumber.
void order_by_home_distance(std::vector<Cluster>& clusters, const GeoPoint& home);

}  // namespace geocluster

#endif  // GEOCLUSTER_BALANCE_HPP
