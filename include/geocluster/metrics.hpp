#ifndef GEOCLUSTER_METRICS_HPP
#define GEOCLUSTER_METRICS_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// Point-to-centroid distances in miles.
struct ClusterStats {
    double min_dist = 0.0;
    double max_dist = 0.0;
    double mean_dist = 0.0;
    double radius_ratio = 0.0;   // max_dist / mean_dist, flags outlier-stretched clusters
    size_t count = 0;
};

std::vector<double> centroid_distances(const std::vector<GeoPoint>& arena,
                                       const Cluster& c);

ClusterStats compute_cluster_stats(const std::vector<GeoPoint>& arena,
                                   const Cluster& c);

std::vector<ClusterStats> compute_cluster_stats(
    const std::vector<GeoPoint>& arena, const std::vector<Cluster>& clusters);

// Distance at index floor(n * pct) of the sorted centroid distances,
// clamped to the largest. 0 for an empty cluster.
double percentile_radius(const std::vector<GeoPoint>& arena, const Cluster& c,
                         double pct);

// Angular width of the member bearings seen from `home`, wrap-aware:
// min(last - first, 360 - (last - first)) over sorted bearings.
double bearing_span_deg(const std::vector<GeoPoint>& arena, const Cluster& c,
                        const GeoPoint& home);

std::vector<size_t> cluster_sizes(const std::vector<Cluster>& clusters);

// max/min size; 0 if any cluster is empty or the list is empty.
double compute_imbalance_ratio(const std::vector<size_t>& sizes);

double compute_cluster_size_stddev(const std::vector<size_t>& sizes);

// Sum of point-to-centroid distances over all clusters.
double total_centroid_distance(const std::vector<GeoPoint>& arena,
                               const std::vector<Cluster>& clusters);

}  // namespace geocluster

#endif  // GEOCLUSTER_METRICS_HPP
