#ifndef GEOCLUSTER_SEEDING_HPP
#define GEOCLUSTER_SEEDING_HPP

#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <random>
#include <vector>

namespace geocluster {

/**
 * k-means++ seeding over arena[members].
 *
 * First seed uniform; each further seed drawn with probability proportional
 * to the squared haversine distance to its nearest chosen seed. If rounding
 * runs the roulette wheel dry without a pick, members[floor(i * n / k)] is
 * taken instead.
 *
 * The generator is the only source of randomness; a fixed-seed mt19937
 * gives reproducible seeds. Requires 1 <= k <= members.size().
 */
std::vector<GeoPoint> kmeanspp_seed(const std::vector<GeoPoint>& arena,
                                    const std::vector<size_t>& members,
                                    size_t k, std::mt19937& rng);

}  // namespace geocluster

#endif  // GEOCLUSTER_SEEDING_HPP
