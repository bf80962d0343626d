#include "geocluster/overload.hpp"
#include "geocluster/balance.hpp"
#include "geocluster/cohesion.hpp"
#include "geocluster/geodesy.hpp"
#include "geocluster/log.hpp"
#include "geocluster/partition.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace geocluster {

namespace {

struct SplitContext {
    const std::vector<GeoPoint>& arena;
    size_t max_points;
    const GeoPoint& home;
    double balance_weight;
    std::mt19937& rng;
    const ClusterConfig& cfg;
    size_t chunked = 0;
};

// Last resort: consecutive runs of max_points, nearest-to-home first.
void chunk_split(SplitContext& ctx, std::vector<size_t> members,
                 std::vector<Cluster>& out) {
    struct Key { size_t idx; double dist; double bearing; };
    std::vector<Key> keys;
    keys.reserve(members.size());
    for (size_t idx : members)
        keys.push_back({idx, haversine_miles(ctx.home, ctx.arena[idx]),
                        initial_bearing_deg(ctx.home, ctx.arena[idx])});
    std::stable_sort(keys.begin(), keys.end(), [](const Key& a, const Key& b) {
        if (a.dist != b.dist) return a.dist < b.dist;
        return a.bearing < b.bearing;
    });

    for (size_t start = 0; start < keys.size(); start += ctx.max_points) {
        size_t end = std::min(start + ctx.max_points, keys.size());
        std::vector<size_t> run;
        run.reserve(end - start);
        for (size_t i = start; i < end; ++i) run.push_back(keys[i].idx);
        out.push_back(make_cluster(ctx.arena, std::move(run)));
    }
    ctx.chunked++;
}

void split_one(SplitContext& ctx, const std::vector<size_t>& members,
               std::vector<Cluster>& out) {
    const size_t n = members.size();
    const size_t sub_count = (n + ctx.max_points - 1) / ctx.max_points;

    PartitionConfig pcfg;
    pcfg.max_iter = ctx.cfg.split_max_iterations;
    pcfg.tightness = ctx.cfg.split_tightness;
    pcfg.tol_miles = ctx.cfg.convergence_miles;
    pcfg.verbose = ctx.cfg.verbose;

    WeightedPartitioner partitioner(ctx.rng);
    std::vector<Cluster> subs = partitioner.run(ctx.arena, members, sub_count, pcfg);
    subs = balance(ctx.arena, std::move(subs), ctx.max_points, ctx.home,
                   ctx.balance_weight, ctx.cfg);

    for (auto& s : subs) {
        if (s.empty()) continue;
        if (s.size() <= ctx.max_points) {
            s.id = kPendingId;
            out.push_back(std::move(s));
        } else if (s.size() < n) {
            split_one(ctx, s.members, out);
        } else {
            chunk_split(ctx, std::move(s.members), out);
        }
    }
}

}  // namespace

std::vector<Cluster> split_overloaded(const std::vector<GeoPoint>& arena,
                                      std::vector<Cluster> clusters,
                                      size_t max_points, const GeoPoint& home,
                                      double balance_weight, std::mt19937& rng,
                                      const ClusterConfig& cfg) {
    if (max_points < 1)
        throw std::invalid_argument("split_overloaded: require max_points >= 1");

    bool any_overloaded = std::any_of(clusters.begin(), clusters.end(),
                                      [max_points](const Cluster& c) {
                                          return c.size() > max_points;
                                      });
    if (!any_overloaded)
        return validate_cohesion(arena, std::move(clusters), home, cfg);

    SplitContext ctx{arena, max_points, home, balance_weight, rng, cfg};
    std::vector<Cluster> out;
    out.reserve(clusters.size());
    size_t overloaded = 0;

    for (auto& c : clusters) {
        if (c.size() <= max_points) {
            out.push_back(std::move(c));
            continue;
        }
        ++overloaded;
        split_one(ctx, c.members, out);
    }

    renumber(out);

    GEOCLUSTER_LOG(cfg.verbose, "overload",
                   "max=%zu split %zu overloaded clusters (%zu chunked) -> %zu clusters",
                   max_points, overloaded, ctx.chunked, out.size());

    return validate_cohesion(arena, std::move(out), home, cfg);
}

}  // namespace geocluster
