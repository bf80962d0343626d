#ifndef GEOCLUSTER_PARTITION_HPP
#define GEOCLUSTER_PARTITION_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace geocluster {

struct PartitionConfig {
    size_t max_iter = 50;
    double tightness = 0.75;    // [0,1]
    double tol_miles = 0.001;   // converged when every centroid moves <= this
    bool verbose = false;
};

/**
 * Tightness-weighted k-means over a subset of a point arena.
 *
 * Each point goes to the centroid minimising distance^(1 + 4 * tightness).
 * With tightness 0 this is plain nearest-centroid; at 1 far points are
 * penalised hard, which yields compact groups at the cost of even sizes.
 * Centroids are spherical means. A centroid that attracts no points keeps
 * its previous position for the next round; clusters still empty at the
 * end are dropped and the survivors numbered 0..N-1.
 *
 * Not reaching convergence within max_iter is not an error: the last
 * state is returned and converged() reports false.
 */
class WeightedPartitioner {
public:
    explicit WeightedPartitioner(std::mt19937& rng);

    std::vector<Cluster> run(const std::vector<GeoPoint>& arena,
                             const std::vector<size_t>& members, size_t k,
                             const PartitionConfig& cfg = {});

    size_t iterations() const { return iterations_; }
    bool converged() const { return converged_; }

private:
    std::mt19937& rng_;
    size_t iterations_ = 0;
    bool converged_ = false;
};

std::vector<Cluster> partition(const std::vector<GeoPoint>& arena,
                               const std::vector<size_t>& members, size_t k,
                               size_t max_iterations, double tightness,
                               std::mt19937& rng);

}  // namespace geocluster

#endif  // GEOCLUSTER_PARTITION_HPP
