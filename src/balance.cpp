#include "geocluster/balance.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/log.hpp"
#include "geocluster/metrics.hpp"

#include <algorithm>
#include <cstddef>
#include <limits>

namespace geocluster {

void order_by_home_distance(std::vector<Cluster>& clusters, const GeoPoint& home) {
    std::stable_sort(clusters.begin(), clusters.end(),
                     [&home](const Cluster& a, const Cluster& b) {
                         return haversine_miles(home, a.centroid) <
                                haversine_miles(home, b.centroid);
                     });
    renumber(clusters);
}

std::vector<Cluster> balance(const std::vector<GeoPoint>& arena,
                             std::vector<Cluster> clusters, size_t max_points,
                             const GeoPoint& home, double balance_weight,
                             const ClusterConfig& cfg) {
    if (balance_weight < cfg.balance_threshold || clusters.size() < 2)
        return clusters;

    size_t total = 0;
    for (const auto& c : clusters) total += c.size();
    const double avg_size = static_cast<double>(total) / static_cast<double>(clusters.size());

    order_by_home_distance(clusters, home);

    size_t moved = 0;
    for (size_t i = 0; i + 1 < clusters.size(); ++i) {
        Cluster& current = clusters[i];
        Cluster& next = clusters[i + 1];

        const double max_next_radius =
            percentile_radius(arena, next, cfg.radius_percentile) * cfg.radius_expansion;

        while (static_cast<double>(current.size()) > avg_size &&
               next.size() < max_points &&
               current.size() > next.size() + 1) {
            size_t best = 0;
            double best_dist = std::numeric_limits<double>::infinity();
            for (size_t m = 0; m < current.members.size(); ++m) {
                double d = haversine_miles(arena[current.members[m]], next.centroid);
                if (d < best_dist) { best_dist = d; best = m; }
            }

            if (best_dist > max_next_radius) break;

            next.members.push_back(current.members[best]);
            current.members.erase(current.members.begin() + static_cast<std::ptrdiff_t>(best));
            current.recompute(arena);
            next.recompute(arena);
            ++moved;
        }
    }

    renumber(clusters);

    GEOCLUSTER_LOG(cfg.verbose, "balance",
                   "weight=%.2f avg=%.1f moved %zu points across %zu clusters",
                   balance_weight, avg_size, moved, clusters.size());
    return clusters;
}

}  // namespace geocluster
