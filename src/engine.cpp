#include "geocluster/engine.hpp"
#include "geocluster/balance.hpp"
#include "geocluster/log.hpp"
#include "geocluster/merge.hpp"
#include "geocluster/metrics.hpp"
#include "geocluster/overload.hpp"
#include "geocluster/partition.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <utility>

namespace geocluster {

size_t optimal_cluster_count(size_t n, size_t max_points, size_t max_clusters) {
    if (max_points == 0 || n <= max_points) return 1;
    size_t min_clusters = (n + max_points - 1) / max_points;
    if (max_clusters > 0 && min_clusters > max_clusters) return max_clusters;
    return min_clusters;
}

size_t initial_cluster_count(size_t n, size_t max_points, double tightness) {
    size_t base = optimal_cluster_count(n, max_points);
    size_t adjusted = static_cast<size_t>(
        std::floor(static_cast<double>(base) * (0.5 + tightness)));
    return std::max(base, adjusted);
}

GeoClusterer::GeoClusterer(ClusterConfig cfg) : cfg_(std::move(cfg)) {
    validate(cfg_);
}

std::vector<Cluster> GeoClusterer::run_indexed(const std::vector<GeoPoint>& points,
                                               const GeoPoint& home) {
    stats_ = RunStats{};
    std::vector<Cluster> clusters;
    if (points.empty()) return clusters;

    const size_t max_points = cfg_.max_points_per_cluster;
    if (points.size() <= max_points) {
        clusters.push_back(make_cluster(points, all_members(points.size()), 0));
        stats_.initial_k = 1;
        stats_.converged = true;
        stats_.clusters = 1;
        return clusters;
    }

    std::mt19937 rng(cfg_.seed ? *cfg_.seed : std::random_device{}());

    PartitionConfig pcfg;
    pcfg.max_iter = cfg_.max_iterations;
    pcfg.tightness = cfg_.tightness;
    pcfg.tol_miles = cfg_.convergence_miles;
    pcfg.verbose = cfg_.verbose;

    stats_.initial_k = initial_cluster_count(points.size(), max_points, cfg_.tightness);

    WeightedPartitioner partitioner(rng);
    clusters = partitioner.run(points, all_members(points.size()), stats_.initial_k, pcfg);
    stats_.partition_iterations = partitioner.iterations();
    stats_.converged = partitioner.converged();

    clusters = split_overloaded(points, std::move(clusters), max_points, home,
                                cfg_.balance_weight, rng, cfg_);

    if (cfg_.merge_adjacent)
        clusters = merge_adjacent(points, std::move(clusters), max_points, home, cfg_);

    order_by_home_distance(clusters, home);
    stats_.clusters = clusters.size();

    if (cfg_.verbose || env_log_enabled()) {
        auto sizes = cluster_sizes(clusters);
        auto [mn, mx] = std::minmax_element(sizes.begin(), sizes.end());
        GEOCLUSTER_LOG(cfg_.verbose, "engine",
                       "n=%zu max=%zu k0=%zu -> %zu clusters (sizes %zu-%zu, stddev %.2f)",
                       points.size(), max_points, stats_.initial_k, clusters.size(),
                       *mn, *mx, compute_cluster_size_stddev(sizes));
    }
    return clusters;
}

std::vector<GeoCluster> GeoClusterer::run(const std::vector<GeoPoint>& points,
                                          const GeoPoint& home) {
    return materialize(points, run_indexed(points, home));
}

std::vector<GeoCluster> cluster(const std::vector<GeoPoint>& points,
                                int max_points, const GeoPoint& home,
                                double tightness, double balance_weight) {
    if (max_points < 1)
        throw std::invalid_argument("cluster: require max_points >= 1");
    ClusterConfig cfg;
    cfg.max_points_per_cluster = static_cast<size_t>(max_points);
    cfg.tightness = tightness;
    cfg.balance_weight = balance_weight;
    GeoClusterer clusterer(cfg);
    return clusterer.run(points, home);
}

}  // namespace geocluster
