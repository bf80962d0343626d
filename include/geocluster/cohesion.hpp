#ifndef GEOCLUSTER_COHESION_HPP
#define GEOCLUSTER_COHESION_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/config.hpp"
#include "geocluster/geo_point.hpp"

#include <vector>

namespace geocluster {

enum class CohesionVerdict { Cohesive, Stretched, SplitByBearing };

/**
 * Classifies one cluster as seen from `home`:
 *   Stretched       max centroid distance > stretch_ratio * mean
 *   SplitByBearing  member bearings span more than max_bearing_span_deg
 *   Cohesive        otherwise, and always for clusters of size <= 1
 * The stretch test takes precedence.
 */
CohesionVerdict classify_cohesion(const std::vector<GeoPoint>& arena,
                                  const Cluster& c, const GeoPoint& home,
                                  const ClusterConfig& cfg = {});

/**
 * One pass over `clusters`, splitting each non-cohesive cluster in two:
 *  - stretched: sorted by centroid distance, cut at floor(n/2) into a close
 *    half and a far half;
 *  - bearing: points within near_bearing_deg of the midpoint of the extreme
 *    bearings form one half, the rest the other.
 * Halves get fresh centroids. The output is renumbered 0..N-1. A set where
 * every cluster is already cohesive comes back unchanged apart from ids.
 */
std::vector<Cluster> validate_cohesion(const std::vector<GeoPoint>& arena,
                                       std::vector<Cluster> clusters,
                                       const GeoPoint& home,
                                       const ClusterConfig& cfg = {});

}  // namespace geocluster

#endif  // GEOCLUSTER_COHESION_HPP
