#ifndef GEOCLUSTER_CONFIG_HPP
#define GEOCLUSTER_CONFIG_HPP

#include <cstddef>
#include <optional>

namespace geocluster {

struct ClusterConfig {
    size_t max_points_per_cluster = 10;  // hard cap per day/team, must be >= 1
    double tightness          = 0.5;     // [0,1], distance exponent 1 + 4t
    double balance_weight     = 0.35;    // [0,1], balancing off below threshold

    size_t max_iterations       = 50;
    size_t split_max_iterations = 30;
    double split_tightness      = 0.8;
    double convergence_miles    = 0.001;

    // Cohesion
    double stretch_ratio        = 3.0;    // max/mean centroid distance
    double max_bearing_span_deg = 100.0;
    double near_bearing_deg     = 90.0;

    // Balancer
    double balance_threshold    = 0.6;
    double radius_percentile    = 0.95;
    double radius_expansion     = 1.5;

    bool merge_adjacent = false;

    // Unset: seeded from std::random_device.
    std::optional<unsigned> seed;
    bool verbose = false;
};

// Throws std::invalid_argument on out-of-range values.
void validate(const ClusterConfig& cfg);

}  // namespace geocluster

#endif  // GEOCLUSTER_CONFIG_HPP
