#include "geocluster/partition.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/log.hpp"
#include "geocluster/seeding.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace geocluster {

namespace {

// Below this the OpenMP fork costs more than the scoring loop.
constexpr size_t kParallelMinPoints = 2048;

}  // namespace

WeightedPartitioner::WeightedPartitioner(std::mt19937& rng) : rng_(rng) {}

std::vector<Cluster> WeightedPartitioner::run(const std::vector<GeoPoint>& arena,
                                              const std::vector<size_t>& members,
                                              size_t k, const PartitionConfig& cfg) {
    if (k == 0)
        throw std::invalid_argument("WeightedPartitioner::run: require k >= 1");
    if (!(cfg.tightness >= 0.0 && cfg.tightness <= 1.0))
        throw std::invalid_argument("WeightedPartitioner::run: require 0 <= tightness <= 1");
    if (cfg.max_iter == 0)
        throw std::invalid_argument("WeightedPartitioner::run: require max_iter >= 1");

    iterations_ = 0;
    converged_ = false;

    const size_t n = members.size();
    std::vector<Cluster> clusters;
    if (n == 0) return clusters;

    if (n <= k) {
        clusters.reserve(n);
        for (size_t idx : members)
            clusters.push_back(make_cluster(arena, {idx}));
        renumber(clusters);
        converged_ = true;
        return clusters;
    }

    std::vector<GeoPoint> seeds = kmeanspp_seed(arena, members, k, rng_);
    clusters.resize(k);
    for (size_t c = 0; c < k; ++c) {
        clusters[c].centroid.latitude = seeds[c].latitude;
        clusters[c].centroid.longitude = seeds[c].longitude;
    }

    const double exponent = 1.0 + 4.0 * cfg.tightness;
    std::vector<size_t> labels(n);

    for (size_t iter = 0; iter < cfg.max_iter; ++iter) {
        #pragma omp parallel for schedule(static) if (n >= kParallelMinPoints)
        for (size_t i = 0; i < n; ++i) {
            const GeoPoint& p = arena[members[i]];
            size_t best = 0;
            double best_score = std::numeric_limits<double>::infinity();
            for (size_t c = 0; c < k; ++c) {
                double score = std::pow(haversine_miles(p, clusters[c].centroid), exponent);
                if (score < best_score) { best_score = score; best = c; }
            }
            labels[i] = best;
        }

        for (auto& c : clusters) c.members.clear();
        for (size_t i = 0; i < n; ++i)
            clusters[labels[i]].members.push_back(members[i]);

        double max_shift = 0.0;
        for (auto& c : clusters) {
            if (c.empty()) continue;
            GeoPoint prev = c.centroid;
            c.recompute(arena);
            double shift = haversine_miles(prev, c.centroid);
            if (shift > max_shift) max_shift = shift;
        }

        iterations_ = iter + 1;
        if (max_shift <= cfg.tol_miles) {
            converged_ = true;
            break;
        }
    }

    renumber(clusters);

    GEOCLUSTER_LOG(cfg.verbose, "partition",
                   "n=%zu k=%zu tightness=%.2f -> %zu clusters in %zu iters%s",
                   n, k, cfg.tightness, clusters.size(), iterations_,
                   converged_ ? "" : " (not converged)");
    return clusters;
}

std::vector<Cluster> partition(const std::vector<GeoPoint>& arena,
                               const std::vector<size_t>& members, size_t k,
                               size_t max_iterations, double tightness,
                               std::mt19937& rng) {
    PartitionConfig cfg;
    cfg.max_iter = max_iterations;
    cfg.tightness = tightness;
    WeightedPartitioner p(rng);
    return p.run(arena, members, k, cfg);
}

}  // namespace geocluster
