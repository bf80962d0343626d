#ifndef GEOCLUSTER_OVERLOAD_HPP
#define GEOCLUSTER_OVERLOAD_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/config.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace geocluster {

/**
 * Brings every cluster down to at most `max_points` members.
 *
 * An overloaded cluster of size n is re-partitioned into ceil(n / max_points)
 * sub-clusters with cfg.split_max_iterations and cfg.split_tightness, then
 * balanced (see balance()). Sub-clusters that are still too large are split
 * again. When a re-partition cannot shrink a cluster (all members share a
 * location, for instance) its members are cut into runs of `max_points`,
 * ordered by distance and bearing from `home`.
 *
 * Clusters within capacity pass through. The combined list always goes
 * through validate_cohesion(), even when nothing was overloaded, and comes
 * back numbered 0..N-1.
 *
 * Throws std::invalid_argument if max_points < 1.
 */
std::vector<Cluster> split_overloaded(const std::vector<GeoPoint>& arena,
                                      std::vector<Cluster> clusters,
                                      size_t max_points, const GeoPoint& home,
                                      double balance_weight, std::mt19937& rng,
                                      const ClusterConfig& cfg = {});

}  // namespace geocluster

#endif  // GEOCLUSTER_OVERLOAD_HPP
