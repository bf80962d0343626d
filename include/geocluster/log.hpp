#ifndef GEOCLUSTER_LOG_HPP
#define GEOCLUSTER_LOG_HPP

#include <cstdio>

namespace geocluster {

// True when GEOCLUSTER_LOG is set to 1/y/Y. Read once per process.
bool env_log_enabled();

}  // namespace geocluster

// Stage log to stderr. `verbose` is usually ClusterConfig::verbose.
#define GEOCLUSTER_LOG(verbose, tag, fmt, ...)                                  \
    do {                                                                        \
        if ((verbose) || ::geocluster::env_log_enabled())                       \
            std::fprintf(stderr, "[" tag "] " fmt "\n", ##__VA_ARGS__);         \
    } while (0)

#endif  // GEOCLUSTER_LOG_HPP
