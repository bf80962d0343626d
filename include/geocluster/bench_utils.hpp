#ifndef GEOCLUSTER_BENCH_UTILS_HPP
#define GEOCLUSTER_BENCH_UTILS_HPP

#include <sys/resource.h>

#include <chrono>

namespace geocluster {

// Wall-clock milliseconds since construction.
class ScopedTimer {
public:
    ScopedTimer() : start_(std::chrono::steady_clock::now()) {}
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }
private:
    std::chrono::steady_clock::time_point start_;
};

// Peak resident set size in MB; 0 if the kernel will not say.
inline double get_peak_rss_mb() {
    struct rusage ru {};
    if (getrusage(RUSAGE_SELF, &ru) != 0) return 0.0;
#ifdef __APPLE__
    return static_cast<double>(ru.ru_maxrss) / (1024.0 * 1024.0);  // bytes
#else
    return static_cast<double>(ru.ru_maxrss) / 1024.0;             // KiB
#endif
}

}  // namespace geocluster

#endif  // GEOCLUSTER_BENCH_UTILS_HPP
