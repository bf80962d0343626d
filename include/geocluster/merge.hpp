#ifndef GEOCLUSTER_MERGE_HPP
#define GEOCLUSTER_MERGE_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/config.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// Mean pairwise haversine distance between members; 0 below two members.
double mean_intra_distance(const std::vector<GeoPoint>& arena, const Cluster& c);

/**
 * Greedy merge of small neighbouring clusters so fewer days are needed.
 * Walking the list in order, each cluster absorbs later ones while the
 * combined size stays within `max_points` and the centroids are no further
 * apart than twice the averaged mean intra-cluster distance of the two
 * (pairs of singletons always qualify). Merged centroids are recomputed on
 * the sphere. The result is ordered by distance from `home` and renumbered.
 */
std::vector<Cluster> merge_adjacent(const std::vector<GeoPoint>& arena,
                                    std::vector<Cluster> clusters,
                                    size_t max_points, const GeoPoint& home,
                                    const ClusterConfig& cfg = {});

}  // namespace geocluster

#endif  // GEOCLUSTER_MERGE_HPP
