#include "geocluster/seeding.hpp"
#include "geocluster/geodesy.hpp"

#include <stdexcept>

namespace geocluster {

std::vector<GeoPoint> kmeanspp_seed(const std::vector<GeoPoint>& arena,
                                    const std::vector<size_t>& members,
                                    size_t k, std::mt19937& rng) {
    const size_t n = members.size();
    if (k == 0 || k > n)
        throw std::invalid_argument("kmeanspp_seed: require 1 <= k <= n");

    std::vector<GeoPoint> seeds;
    seeds.reserve(k);

    std::uniform_int_distribution<size_t> uidx(0, n - 1);
    seeds.push_back(arena[members[uidx(rng)]]);

    // Squared distance to the nearest chosen seed, kept incrementally.
    std::vector<double> min_dist(n);
    for (size_t j = 0; j < n; ++j) {
        double d = haversine_miles(arena[members[j]], seeds.front());
        min_dist[j] = d * d;
    }

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    for (size_t i = 1; i < k; ++i) {
        double total = 0.0;
        for (double d : min_dist) total += d;

        double r = unit(rng) * total;
        bool picked = false;
        for (size_t j = 0; j < n; ++j) {
            r -= min_dist[j];
            if (r <= 0.0) {
                seeds.push_back(arena[members[j]]);
                picked = true;
                break;
            }
        }
        // Rounding can leave r just above zero; a non-finite total never lands.
        if (!picked)
            seeds.push_back(arena[members[(i * n) / k]]);

        const GeoPoint& added = seeds.back();
        for (size_t j = 0; j < n; ++j) {
            double d = haversine_miles(arena[members[j]], added);
            if (d * d < min_dist[j]) min_dist[j] = d * d;
        }
    }

    return seeds;
}

}  // namespace geocluster
