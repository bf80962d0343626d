#include "geocluster/config.hpp"

#include <stdexcept>

namespace geocluster {

void validate(const ClusterConfig& cfg) {
    if (cfg.max_points_per_cluster < 1)
        throw std::invalid_argument("ClusterConfig: require max_points_per_cluster >= 1");
    if (!(cfg.tightness >= 0.0 && cfg.tightness <= 1.0) ||
        !(cfg.split_tightness >= 0.0 && cfg.split_tightness <= 1.0))
        throw std::invalid_argument("ClusterConfig: require 0 <= tightness <= 1");
    if (!(cfg.balance_weight >= 0.0 && cfg.balance_weight <= 1.0))
        throw std::invalid_argument("ClusterConfig: require 0 <= balance_weight <= 1");
    if (cfg.max_iterations == 0 || cfg.split_max_iterations == 0)
        throw std::invalid_argument("ClusterConfig: require max_iterations > 0");
    if (!(cfg.convergence_miles >= 0.0))
        throw std::invalid_argument("ClusterConfig: require convergence_miles >= 0");
    if (!(cfg.stretch_ratio > 1.0))
        throw std::invalid_argument("ClusterConfig: require stretch_ratio > 1");
    if (!(cfg.max_bearing_span_deg > 0.0 && cfg.max_bearing_span_deg <= 180.0) ||
        !(cfg.near_bearing_deg > 0.0 && cfg.near_bearing_deg <= 180.0))
        throw std::invalid_argument("ClusterConfig: require bearing limits in (0, 180]");
    if (!(cfg.radius_percentile > 0.0 && cfg.radius_percentile <= 1.0))
        throw std::invalid_argument("ClusterConfig: require 0 < radius_percentile <= 1");
    if (!(cfg.radius_expansion >= 1.0))
        throw std::invalid_argument("ClusterConfig: require radius_expansion >= 1");
}

}  // namespace geocluster
