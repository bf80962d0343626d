#ifndef GEOCLUSTER_GEODESY_HPP
#define GEOCLUSTER_GEODESY_HPP

#include "geocluster/geo_point.hpp"

#include <cstddef>
#include <vector>

namespace geocluster {

// Great-circle distance in statute miles (haversine, R = 3959 mi).
double haversine_miles(const GeoPoint& a, const GeoPoint& b);

// Initial compass bearing from `from` to `to`, normalised to [0, 360).
double initial_bearing_deg(const GeoPoint& from, const GeoPoint& to);

// Point reached by travelling `miles` from `origin` along `bearing_deg`.
GeoPoint destination_point(const GeoPoint& origin, double bearing_deg, double miles);

// Smallest angle between two bearings, in [0, 180].
double angular_difference_deg(double a, double b);

/**
 * Mean position on the sphere: each point becomes a unit vector
 * (cos(lat)cos(lon), cos(lat)sin(lon), sin(lat)), the vectors are averaged
 * and the result is converted back with atan2. Unlike a linear average of
 * degrees this is well behaved across the antimeridian and near the poles.
 *
 * An empty set yields {0, 0}. That is a sentinel, not a location.
 */
GeoPoint spherical_centroid(const std::vector<GeoPoint>& points);

// Same, over a subset of an arena given by indices.
GeoPoint spherical_centroid(const std::vector<GeoPoint>& arena,
                            const std::vector<size_t>& members);

}  // namespace geocluster

#endif  // GEOCLUSTER_GEODESY_HPP
