#ifndef GEOCLUSTER_CLUSTER_HPP
#define GEOCLUSTER_CLUSTER_HPP

#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// Id carried by a cluster that was just split and has not been renumbered.
constexpr int kPendingId = -1;

/**
 * Working cluster. Members are indices into a single point arena owned by
 * the caller of each stage, so splitting, balancing and merging only ever
 * move indices around and never alias the caller's points.
 *
 * Invariant on anything a stage returns: `centroid` is the spherical mean
 * of the members (recompute() after every change to `members`).
 */
struct Cluster {
    int id = kPendingId;
    GeoPoint centroid;
    std::vector<size_t> members;

    size_t size() const { return members.size(); }
    bool empty() const { return members.empty(); }

    void recompute(const std::vector<GeoPoint>& arena);
};

// Caller-facing cluster: owns copies of its points.
struct GeoCluster {
    int id = 0;
    GeoPoint centroid;
    std::vector<GeoPoint> points;

    size_t size() const { return points.size(); }
};

Cluster make_cluster(const std::vector<GeoPoint>& arena,
                     std::vector<size_t> members, int id = kPendingId);

// Drops empty clusters and assigns ids 0..N-1 in list order.
void renumber(std::vector<Cluster>& clusters);

// Copies member points out of the arena. Expects a renumbered list.
std::vector<GeoCluster> materialize(const std::vector<GeoPoint>& arena,
                                    const std::vector<Cluster>& clusters);

// Identity membership 0..n-1, the starting point of every top-level run.
std::vector<size_t> all_members(size_t n);

}  // namespace geocluster

#endif  // GEOCLUSTER_CLUSTER_HPP
