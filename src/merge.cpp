#include "geocluster/merge.hpp"
#include "geocluster/balance.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/log.hpp"

#include <utility>

namespace geocluster {

double mean_intra_distance(const std::vector<GeoPoint>& arena, const Cluster& c) {
    if (c.size() <= 1) return 0.0;
    double total = 0.0;
    size_t pairs = 0;
    for (size_t a = 0; a < c.members.size(); ++a) {
        for (size_t b = a + 1; b < c.members.size(); ++b) {
            total += haversine_miles(arena[c.members[a]], arena[c.members[b]]);
            ++pairs;
        }
    }
    return total / static_cast<double>(pairs);
}

std::vector<Cluster> merge_adjacent(const std::vector<GeoPoint>& arena,
                                    std::vector<Cluster> clusters,
                                    size_t max_points, const GeoPoint& home,
                                    const ClusterConfig& cfg) {
    std::vector<Cluster> merged;
    std::vector<bool> taken(clusters.size(), false);
    size_t merges = 0;

    for (size_t i = 0; i < clusters.size(); ++i) {
        if (taken[i]) continue;
        taken[i] = true;
        Cluster current = std::move(clusters[i]);

        for (size_t j = i + 1; j < clusters.size(); ++j) {
            if (taken[j]) continue;
            const Cluster& candidate = clusters[j];
            if (current.size() + candidate.size() > max_points) continue;

            double gap = haversine_miles(current.centroid, candidate.centroid);
            double intra = (mean_intra_distance(arena, current) +
                            mean_intra_distance(arena, candidate)) / 2.0;
            if (intra > 0.0 && gap > intra * 2.0) continue;

            current.members.insert(current.members.end(),
                                   candidate.members.begin(), candidate.members.end());
            current.recompute(arena);
            taken[j] = true;
            ++merges;
        }

        merged.push_back(std::move(current));
    }

    order_by_home_distance(merged, home);

    GEOCLUSTER_LOG(cfg.verbose, "merge", "merged %zu pairs -> %zu clusters",
                   merges, merged.size());
    return merged;
}

}  // namespace geocluster
