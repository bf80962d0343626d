#include "geocluster/cluster.hpp"
#include "geocluster/geodesy.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace geocluster {

void Cluster::recompute(const std::vector<GeoPoint>& arena) {
    if (members.empty()) return;
    centroid = spherical_centroid(arena, members);
}

Cluster make_cluster(const std::vector<GeoPoint>& arena,
                     std::vector<size_t> members, int id) {
    Cluster c;
    c.id = id;
    c.members = std::move(members);
    c.recompute(arena);
    return c;
}

void renumber(std::vector<Cluster>& clusters) {
    clusters.erase(std::remove_if(clusters.begin(), clusters.end(),
                                  [](const Cluster& c) { return c.empty(); }),
                   clusters.end());
    int next = 0;
    for (auto& c : clusters) c.id = next++;
}

std::vector<GeoCluster> materialize(const std::vector<GeoPoint>& arena,
                                    const std::vector<Cluster>& clusters) {
    std::vector<GeoCluster> out;
    out.reserve(clusters.size());
    for (const auto& c : clusters) {
        GeoCluster g;
        g.id = c.id;
        g.centroid = c.centroid;
        g.points.reserve(c.members.size());
        for (size_t idx : c.members) g.points.push_back(arena[idx]);
        out.push_back(std::move(g));
    }
    return out;
}

std::vector<size_t> all_members(size_t n) {
    std::vector<size_t> m(n);
    std::iota(m.begin(), m.end(), size_t(0));
    return m;
}

}  // namespace geocluster
