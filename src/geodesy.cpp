#include "geocluster/geodesy.hpp"

#include <algorithm>
#include <cmath>

namespace geocluster {

namespace {

struct UnitVec {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

inline void accumulate(UnitVec& acc, const GeoPoint& p) {
    double lat = to_radians(p.latitude);
    double lon = to_radians(p.longitude);
    acc.x += std::cos(lat) * std::cos(lon);
    acc.y += std::cos(lat) * std::sin(lon);
    acc.z += std::sin(lat);
}

GeoPoint from_mean(const UnitVec& sum, size_t n) {
    double x = sum.x / static_cast<double>(n);
    double y = sum.y / static_cast<double>(n);
    double z = sum.z / static_cast<double>(n);

    double lon = std::atan2(y, x);
    double hyp = std::sqrt(x * x + y * y);
    double lat = std::atan2(z, hyp);

    GeoPoint c;
    c.latitude = to_degrees(lat);
    c.longitude = to_degrees(lon);
    return c;
}

}  // namespace

double haversine_miles(const GeoPoint& a, const GeoPoint& b) {
    double dlat = to_radians(b.latitude - a.latitude);
    double dlon = to_radians(b.longitude - a.longitude);
    double s1 = std::sin(dlat / 2.0);
    double s2 = std::sin(dlon / 2.0);
    double h = s1 * s1 +
               std::cos(to_radians(a.latitude)) * std::cos(to_radians(b.latitude)) * s2 * s2;
    // Rounding can push h a hair above 1 for near-antipodal pairs.
    if (h > 1.0) h = 1.0;
    double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return kEarthRadiusMiles * c;
}

double initial_bearing_deg(const GeoPoint& from, const GeoPoint& to) {
    double lat1 = to_radians(from.latitude);
    double lat2 = to_radians(to.latitude);
    double dlon = to_radians(to.longitude - from.longitude);

    double y = std::sin(dlon) * std::cos(lat2);
    double x = std::cos(lat1) * std::sin(lat2) -
               std::sin(lat1) * std::cos(lat2) * std::cos(dlon);

    double bearing = std::fmod(to_degrees(std::atan2(y, x)) + 360.0, 360.0);
    return bearing >= 360.0 ? 0.0 : bearing;
}

GeoPoint destination_point(const GeoPoint& origin, double bearing_deg, double miles) {
    double delta = miles / kEarthRadiusMiles;
    double theta = to_radians(bearing_deg);
    double lat1 = to_radians(origin.latitude);
    double lon1 = to_radians(origin.longitude);

    double lat2 = std::asin(std::sin(lat1) * std::cos(delta) +
                            std::cos(lat1) * std::sin(delta) * std::cos(theta));
    double lon2 = lon1 + std::atan2(std::sin(theta) * std::sin(delta) * std::cos(lat1),
                                    std::cos(delta) - std::sin(lat1) * std::sin(lat2));

    GeoPoint p;
    p.latitude = to_degrees(lat2);
    p.longitude = std::remainder(to_degrees(lon2), 360.0);
    return p;
}

double angular_difference_deg(double a, double b) {
    double diff = std::fabs(a - b);
    return std::min(diff, 360.0 - diff);
}

GeoPoint spherical_centroid(const std::vector<GeoPoint>& points) {
    if (points.empty()) return GeoPoint{};
    UnitVec sum;
    for (const auto& p : points) accumulate(sum, p);
    return from_mean(sum, points.size());
}

GeoPoint spherical_centroid(const std::vector<GeoPoint>& arena,
                            const std::vector<size_t>& members) {
    if (members.empty()) return GeoPoint{};
    UnitVec sum;
    for (size_t idx : members) accumulate(sum, arena[idx]);
    return from_mean(sum, members.size());
}

}  // namespace geocluster
