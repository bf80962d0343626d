#ifndef GEOCLUSTER_DATA_GENERATOR_HPP
#define GEOCLUSTER_DATA_GENERATOR_HPP

#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// Synthetic facility sets for tests and benchmarks. Every point gets an id
// "F<index>" so coverage can be checked by id.

// n points uniform in [lat0, lat0 + size_deg] x [lon0, lon0 + size_deg].
std::vector<GeoPoint> generate_uniform_box(size_t n, double lat0, double lon0,
                                           double size_deg, unsigned seed);

// n points from num_sites Gaussian blobs (sigma in miles) whose centres lie
// uniformly within `radius_miles` of `home`. Points are dealt round-robin.
std::vector<GeoPoint> generate_facility_sites(size_t n, const GeoPoint& home,
                                              int num_sites, double radius_miles,
                                              double sigma_miles, unsigned seed);

// n points at random bearings from `home`, distance uniform in
// [min_miles, max_miles]. Useful for opposite-side-of-depot cases.
std::vector<GeoPoint> generate_ring(size_t n, const GeoPoint& home,
                                    double min_miles, double max_miles,
                                    unsigned seed);

}  // namespace geocluster

#endif  // GEOCLUSTER_DATA_GENERATOR_HPP
