#include "geocluster/cohesion.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/log.hpp"
#include "geocluster/metrics.hpp"

#include <algorithm>
#include <utility>

namespace geocluster {

namespace {

struct Keyed {
    size_t idx;
    double key;
};

void push_nonempty(std::vector<Cluster>& out, const std::vector<GeoPoint>& arena,
                   std::vector<size_t> members, int id) {
    if (members.empty()) return;
    out.push_back(make_cluster(arena, std::move(members), id));
}

void split_stretched(std::vector<Cluster>& out, const std::vector<GeoPoint>& arena,
                     const Cluster& c) {
    std::vector<Keyed> by_dist;
    by_dist.reserve(c.size());
    for (size_t idx : c.members)
        by_dist.push_back({idx, haversine_miles(arena[idx], c.centroid)});
    std::stable_sort(by_dist.begin(), by_dist.end(),
                     [](const Keyed& a, const Keyed& b) { return a.key < b.key; });

    size_t mid = by_dist.size() / 2;
    std::vector<size_t> close, far;
    close.reserve(mid);
    far.reserve(by_dist.size() - mid);
    for (size_t i = 0; i < by_dist.size(); ++i)
        (i < mid ? close : far).push_back(by_dist[i].idx);

    push_nonempty(out, arena, std::move(close), c.id);
    push_nonempty(out, arena, std::move(far), kPendingId);
}

void split_by_bearing(std::vector<Cluster>& out, const std::vector<GeoPoint>& arena,
                      const Cluster& c, const GeoPoint& home, double near_deg) {
    std::vector<Keyed> by_bearing;
    by_bearing.reserve(c.size());
    for (size_t idx : c.members)
        by_bearing.push_back({idx, initial_bearing_deg(home, arena[idx])});
    std::stable_sort(by_bearing.begin(), by_bearing.end(),
                     [](const Keyed& a, const Keyed& b) { return a.key < b.key; });

    double mid_bearing = (by_bearing.front().key + by_bearing.back().key) / 2.0;

    std::vector<size_t> near, far;
    for (const auto& kb : by_bearing) {
        if (angular_difference_deg(kb.key, mid_bearing) < near_deg)
            near.push_back(kb.idx);
        else
            far.push_back(kb.idx);
    }

    push_nonempty(out, arena, std::move(near), c.id);
    push_nonempty(out, arena, std::move(far), kPendingId);
}

}  // namespace

CohesionVerdict classify_cohesion(const std::vector<GeoPoint>& arena,
                                  const Cluster& c, const GeoPoint& home,
                                  const ClusterConfig& cfg) {
    if (c.size() <= 1) return CohesionVerdict::Cohesive;

    ClusterStats s = compute_cluster_stats(arena, c);
    if (s.max_dist > s.mean_dist * cfg.stretch_ratio)
        return CohesionVerdict::Stretched;

    if (bearing_span_deg(arena, c, home) > cfg.max_bearing_span_deg)
        return CohesionVerdict::SplitByBearing;

    return CohesionVerdict::Cohesive;
}

std::vector<Cluster> validate_cohesion(const std::vector<GeoPoint>& arena,
                                       std::vector<Cluster> clusters,
                                       const GeoPoint& home,
                                       const ClusterConfig& cfg) {
    std::vector<Cluster> out;
    out.reserve(clusters.size());
    size_t stretched = 0, by_bearing = 0;

    for (auto& c : clusters) {
        switch (classify_cohesion(arena, c, home, cfg)) {
        case CohesionVerdict::Stretched:
            split_stretched(out, arena, c);
            ++stretched;
            break;
        case CohesionVerdict::SplitByBearing:
            split_by_bearing(out, arena, c, home, cfg.near_bearing_deg);
            ++by_bearing;
            break;
        case CohesionVerdict::Cohesive:
            out.push_back(std::move(c));
            break;
        }
    }

    renumber(out);

    if (stretched || by_bearing)
        GEOCLUSTER_LOG(cfg.verbose, "cohesion",
                       "split %zu stretched, %zu by bearing -> %zu clusters",
                       stretched, by_bearing, out.size());
    return out;
}

}  // namespace geocluster
