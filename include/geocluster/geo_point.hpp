#ifndef GEOCLUSTER_GEO_POINT_HPP
#define GEOCLUSTER_GEO_POINT_HPP

#include <optional>
#include <string>

namespace geocluster {

constexpr double kEarthRadiusMiles = 3959.0;
constexpr double kPi = 3.14159265358979323846;

/**
 * A facility location in degrees. Ranges are the caller's responsibility:
 * latitude in [-90, 90], longitude in [-180, 180].
 * `id` is carried through clustering untouched so results can be joined
 * back to the source records.
 */
struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<std::string> id;
};

inline bool same_location(const GeoPoint& a, const GeoPoint& b) {
    return a.latitude == b.latitude && a.longitude == b.longitude;
}

inline double to_radians(double deg) { return deg * kPi / 180.0; }
inline double to_degrees(double rad) { return rad * 180.0 / kPi; }

}  // namespace geocluster

#endif  // GEOCLUSTER_GEO_POINT_HPP
