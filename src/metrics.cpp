#include "geocluster/metrics.hpp"
#include "geocluster/geodesy.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace geocluster {

std::vector<double> centroid_distances(const std::vector<GeoPoint>& arena,
                                       const Cluster& c) {
    std::vector<double> d;
    d.reserve(c.members.size());
    for (size_t idx : c.members)
        d.push_back(haversine_miles(arena[idx], c.centroid));
    return d;
}

ClusterStats compute_cluster_stats(const std::vector<GeoPoint>& arena,
                                   const Cluster& c) {
    ClusterStats s;
    if (c.empty()) return s;

    s.min_dist = std::numeric_limits<double>::max();
    for (size_t idx : c.members) {
        double dist = haversine_miles(arena[idx], c.centroid);
        if (dist < s.min_dist) s.min_dist = dist;
        if (dist > s.max_dist) s.max_dist = dist;
        s.mean_dist += dist;
        s.count++;
    }
    s.mean_dist /= static_cast<double>(s.count);
    s.radius_ratio = (s.mean_dist > 0.0) ? s.max_dist / s.mean_dist : 0.0;
    return s;
}

std::vector<ClusterStats> compute_cluster_stats(
    const std::vector<GeoPoint>& arena, const std::vector<Cluster>& clusters) {
    std::vector<ClusterStats> stats;
    stats.reserve(clusters.size());
    for (const auto& c : clusters) stats.push_back(compute_cluster_stats(arena, c));
    return stats;
}

double percentile_radius(const std::vector<GeoPoint>& arena, const Cluster& c,
                         double pct) {
    if (c.empty()) return 0.0;
    auto d = centroid_distances(arena, c);
    std::sort(d.begin(), d.end());
    size_t idx = static_cast<size_t>(std::floor(static_cast<double>(d.size()) * pct));
    if (idx >= d.size()) idx = d.size() - 1;
    return d[idx];
}

double bearing_span_deg(const std::vector<GeoPoint>& arena, const Cluster& c,
                        const GeoPoint& home) {
    if (c.size() < 2) return 0.0;
    double lo = 360.0;
    double hi = 0.0;
    for (size_t idx : c.members) {
        double b = initial_bearing_deg(home, arena[idx]);
        lo = std::min(lo, b);
        hi = std::max(hi, b);
    }
    double raw = hi - lo;
    return std::min(raw, 360.0 - raw);
}

std::vector<size_t> cluster_sizes(const std::vector<Cluster>& clusters) {
    std::vector<size_t> sizes;
    sizes.reserve(clusters.size());
    for (const auto& c : clusters) sizes.push_back(c.size());
    return sizes;
}

double compute_imbalance_ratio(const std::vector<size_t>& sizes) {
    if (sizes.empty()) return 0.0;
    auto [mn, mx] = std::minmax_element(sizes.begin(), sizes.end());
    if (*mn == 0) return 0.0;
    return static_cast<double>(*mx) / static_cast<double>(*mn);
}

double compute_cluster_size_stddev(const std::vector<size_t>& sizes) {
    if (sizes.empty()) return 0.0;
    double sum = std::accumulate(sizes.begin(), sizes.end(), 0.0);
    double mean = sum / static_cast<double>(sizes.size());
    double var = 0.0;
    for (size_t s : sizes) {
        double d = static_cast<double>(s) - mean;
        var += d * d;
    }
    return std::sqrt(var / static_cast<double>(sizes.size()));
}

double total_centroid_distance(const std::vector<GeoPoint>& arena,
                               const std::vector<Cluster>& clusters) {
    double total = 0.0;
    for (const auto& c : clusters)
        for (size_t idx : c.members)
            total += haversine_miles(arena[idx], c.centroid);
    return total;
}

}  // namespace geocluster
