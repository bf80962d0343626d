#include "geocluster/data_generator.hpp"
#include "geocluster/geodesy.hpp"

#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace geocluster {

namespace {

GeoPoint tagged(GeoPoint p, size_t i) {
    p.id = "F" + std::to_string(i);
    return p;
}

}  // namespace

std::vector<GeoPoint> generate_uniform_box(size_t n, double lat0, double lon0,
                                           double size_deg, unsigned seed) {
    if (size_deg <= 0.0)
        throw std::invalid_argument("generate_uniform_box: size_deg must be > 0");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> off(0.0, size_deg);

    std::vector<GeoPoint> pts;
    pts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        GeoPoint p;
        p.latitude = lat0 + off(rng);
        p.longitude = lon0 + off(rng);
        pts.push_back(tagged(p, i));
    }
    return pts;
}

std::vector<GeoPoint> generate_facility_sites(size_t n, const GeoPoint& home,
                                              int num_sites, double radius_miles,
                                              double sigma_miles, unsigned seed) {
    if (num_sites <= 0 || radius_miles <= 0.0 || sigma_miles < 0.0)
        throw std::invalid_argument("generate_facility_sites: invalid parameters");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> bearing(0.0, 360.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    // Site centres uniform over the disc around home.
    std::vector<GeoPoint> sites(static_cast<size_t>(num_sites));
    for (auto& s : sites)
        s = destination_point(home, bearing(rng), radius_miles * std::sqrt(unit(rng)));

    std::normal_distribution<double> noise(0.0, sigma_miles > 0.0 ? sigma_miles : 1.0);
    std::vector<GeoPoint> pts;
    pts.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const GeoPoint& site = sites[i % sites.size()];
        double dist = sigma_miles > 0.0 ? std::fabs(noise(rng)) : 0.0;
        pts.push_back(tagged(destination_point(site, bearing(rng), dist), i));
    }
    return pts;
}

std::vector<GeoPoint> generate_ring(size_t n, const GeoPoint& home,
                                    double min_miles, double max_miles,
                                    unsigned seed) {
    if (min_miles < 0.0 || max_miles < min_miles)
        throw std::invalid_argument("generate_ring: require 0 <= min_miles <= max_miles");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> bearing(0.0, 360.0);
    std::uniform_real_distribution<double> dist(min_miles, std::nextafter(max_miles, max_miles + 1.0));

    std::vector<GeoPoint> pts;
    pts.reserve(n);
    for (size_t i = 0; i < n; ++i)
        pts.push_back(tagged(destination_point(home, bearing(rng), dist(rng)), i));
    return pts;
}

}  // namespace geocluster
