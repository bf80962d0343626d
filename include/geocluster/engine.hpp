#ifndef GEOCLUSTER_ENGINE_HPP
#define GEOCLUSTER_ENGINE_HPP

#include "geocluster/cluster.hpp"
#include "geocluster/config.hpp"
#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// 1 when everything fits, else ceil(n / max_points), capped at
// max_clusters when that is non-zero.
size_t optimal_cluster_count(size_t n, size_t max_points, size_t max_clusters = 0);

// Partitioner k for the top-level run: max(base, floor(base * (0.5 + tightness))).
size_t initial_cluster_count(size_t n, size_t max_points, double tightness);

struct RunStats {
    size_t initial_k = 0;
    size_t partition_iterations = 0;
    bool converged = false;
    size_t clusters = 0;
};

/**
 * Full grouping pipeline for one day/team planning request:
 *   weighted partition -> overload split (+ balance) -> cohesion check
 *   -> optional adjacent merge -> order by distance from home.
 *
 * Each run() starts from a fresh generator (cfg.seed, or random_device when
 * unset), so a seeded clusterer returns identical output for identical
 * input and nothing carries over between calls.
 */
class GeoClusterer {
public:
    // Throws std::invalid_argument if the config does not validate.
    explicit GeoClusterer(ClusterConfig cfg);

    std::vector<GeoCluster> run(const std::vector<GeoPoint>& points,
                                const GeoPoint& home);

    // Index form of run(): members refer into `points`.
    std::vector<Cluster> run_indexed(const std::vector<GeoPoint>& points,
                                     const GeoPoint& home);

    const ClusterConfig& config() const { return cfg_; }
    const RunStats& last_run() const { return stats_; }

private:
    ClusterConfig cfg_;
    RunStats stats_;
};

/**
 * Convenience entry with the defaults used by route planning.
 * Empty input gives an empty list; n <= max_points gives one cluster.
 * Throws std::invalid_argument if max_points < 1 (checked before any other
 * work, empty input included) or a weight is outside [0,1].
 */
std::vector<GeoCluster> cluster(const std::vector<GeoPoint>& points,
                                int max_points, const GeoPoint& home,
                                double tightness = 0.5,
                                double balance_weight = 0.35);

}  // namespace geocluster

#endif  // GEOCLUSTER_ENGINE_HPP
